#include "git_utils.hpp"
#include <system_error>

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error Output string receiving the error description.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

/**
 * @brief Turn a libgit2 directory string into a canonical path.
 *
 * libgit2 reports directories with a trailing separator, which would leave an
 * empty filename component on the path.
 */
static fs::path to_dir_path(const char* raw) {
    if (!raw)
        return {};
    std::string s(raw);
    while (s.size() > 1 && (s.back() == '/' || s.back() == '\\'))
        s.pop_back();
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(s), ec);
    if (ec)
        return fs::path(s).lexically_normal();
    return canonical;
}

std::optional<RepoLocation> discover_repository(const fs::path& start, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, start.string().c_str(), 0, nullptr) != 0) {
        set_error(error);
        return std::nullopt;
    }
    repo_ptr r(raw);
    RepoLocation loc;
    loc.bare = git_repository_is_bare(r.get()) != 0;
    loc.git_dir = to_dir_path(git_repository_path(r.get()));
    loc.common_dir = to_dir_path(git_repository_commondir(r.get()));
    if (loc.common_dir.empty())
        loc.common_dir = loc.git_dir;
    if (!loc.bare)
        loc.work_tree = to_dir_path(git_repository_workdir(r.get()));
    return loc;
}

std::optional<fs::path> read_config_path(const std::string& key, std::string* error) {
    git_config* raw = nullptr;
    if (git_config_open_default(&raw) != 0) {
        set_error(error);
        return std::nullopt;
    }
    config_ptr cfg(raw);
    git_buf buf = {nullptr, 0, 0};
    int rc = git_config_get_path(&buf, cfg.get(), key.c_str());
    if (rc == GIT_ENOTFOUND)
        return std::nullopt;
    if (rc != 0) {
        set_error(error);
        return std::nullopt;
    }
    std::string value = buf.ptr ? buf.ptr : "";
    git_buf_dispose(&buf);
    if (value.empty())
        return std::nullopt;
    return fs::path(value);
}

} // namespace git
