#include "git_context.hpp"
#include <utility>
#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace git_context {

GitContextResolver::GitContextResolver(fs::path start_dir) : start_dir_(std::move(start_dir)) {}

const GitContext& GitContextResolver::resolve() {
    if (cached_)
        return *cached_;
    ++queries_;
    std::string err;
    auto loc = git::discover_repository(start_dir_, &err);
    if (!loc) {
        log_error("Repository discovery failed", {{"cwd", start_dir_.string()}, {"error", err}});
        throw IgnoreError(ErrorKind::NotAGitRepository,
                          "Not in a git repository (cwd: " + start_dir_.string() + "): " + err,
                          start_dir_);
    }
    if (loc->bare || loc->work_tree.empty()) {
        log_error("Repository has no working tree", {{"git_dir", loc->git_dir.string()}});
        throw IgnoreError(ErrorKind::NotAGitRepository,
                          "Not in a git working tree (cwd: " + start_dir_.string() +
                              "): repository at " + loc->git_dir.string() + " is bare",
                          start_dir_);
    }
    cached_ = GitContext{loc->work_tree, loc->git_dir, loc->common_dir};
    log_debug("Resolved git context", {{"work_tree", cached_->work_tree.string()},
                                       {"git_dir", cached_->git_dir.string()},
                                       {"common_dir", cached_->common_dir.string()}});
    return *cached_;
}

ExcludesLookup current_excludes_lookup() {
    ExcludesLookup lookup;
    std::string err;
    lookup.configured = git::read_config_path("core.excludesFile", &err);
    if (!err.empty())
        log_warning("Could not read git configuration", {{"error", err}});
    if (auto xdg = procutil::safe_getenv("XDG_CONFIG_HOME"); xdg && !xdg->empty())
        lookup.xdg_config_home = fs::path(*xdg);
    lookup.home = procutil::home_directory();
    std::error_code ec;
    lookup.working_dir = fs::current_path(ec);
    return lookup;
}

fs::path repository_ignore_path(const GitContext& ctx) { return ctx.work_tree / ".gitignore"; }

// git reads info/exclude from the common directory, so every worktree of a
// repository shares one exclude file.
fs::path local_exclude_path(const GitContext& ctx) {
    return ctx.common_dir / "info" / "exclude";
}

fs::path global_excludes_path(const ExcludesLookup& lookup) {
    if (lookup.configured && !lookup.configured->empty()) {
        fs::path p = *lookup.configured;
        if (p.is_relative()) {
            if (lookup.working_dir.empty())
                throw IgnoreError(ErrorKind::Configuration,
                                  "core.excludesFile is relative (" + p.string() +
                                      ") and the working directory is unknown",
                                  p);
            p = lookup.working_dir / p;
        }
        return p.lexically_normal();
    }
    fs::path fallback;
    if (lookup.xdg_config_home)
        fallback = *lookup.xdg_config_home / "git" / "ignore";
    else if (lookup.home)
        fallback = *lookup.home / ".config" / "git" / "ignore";
    std::error_code ec;
    if (!fallback.empty() && fs::is_regular_file(fallback, ec))
        return fallback;
    throw IgnoreError(ErrorKind::Configuration,
                      "No global gitignore file configured. Set core.excludesFile or create "
                      "~/.config/git/ignore",
                      fallback);
}

fs::path resolve_target_path(TargetKind kind, GitContextResolver& resolver,
                             const ExcludesLookup& lookup) {
    switch (kind) {
    case TargetKind::Repository:
        return repository_ignore_path(resolver.resolve());
    case TargetKind::Local:
        return local_exclude_path(resolver.resolve());
    case TargetKind::Global:
        return global_excludes_path(lookup);
    }
    throw IgnoreError(ErrorKind::Unexpected, "Unknown ignore target");
}

std::string target_description(TargetKind kind, const fs::path& path) {
    switch (kind) {
    case TargetKind::Repository:
        return "repository .gitignore (" + path.string() + ")";
    case TargetKind::Local:
        return "local exclude file (" + path.string() + ")";
    case TargetKind::Global:
        return "global gitignore (" + path.string() + ")";
    }
    return path.string();
}

} // namespace git_context
