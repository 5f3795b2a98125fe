#ifndef GIT_CONTEXT_HPP
#define GIT_CONTEXT_HPP
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace git_context {
namespace fs = std::filesystem;

/**
 * @brief Which ignore file a request writes to.
 */
enum class TargetKind {
    Repository, ///< `.gitignore` at the working-tree root
    Local,      ///< `info/exclude` inside the git-data directory
    Global      ///< the user's global excludes file
};

/**
 * @brief Resolved repository paths for the current invocation.
 *
 * `common_dir` is the shared git-data directory; it differs from `git_dir`
 * only inside a linked worktree.
 */
struct GitContext {
    fs::path work_tree;
    fs::path git_dir;
    fs::path common_dir;
};

/**
 * @brief Resolves and caches the @ref GitContext of a start directory.
 *
 * The underlying libgit2 query runs at most once per resolver; later calls
 * return the cached value. Failed lookups are not cached.
 */
class GitContextResolver {
  public:
    explicit GitContextResolver(fs::path start_dir);

    /**
     * @brief Resolve the enclosing repository.
     *
     * @throws IgnoreError with ErrorKind::NotAGitRepository when no repository
     *         with a working tree encloses the start directory.
     */
    const GitContext& resolve();

    const fs::path& start_dir() const { return start_dir_; }

    /** @return Number of repository discoveries performed so far. */
    std::size_t query_count() const { return queries_; }

  private:
    fs::path start_dir_;
    std::optional<GitContext> cached_;
    std::size_t queries_ = 0;
};

/**
 * @brief Inputs for locating the global excludes file.
 *
 * Kept separate from the environment so lookups can be tested with injected
 * directories.
 */
struct ExcludesLookup {
    std::optional<fs::path> configured; ///< value of `core.excludesFile`
    std::optional<fs::path> xdg_config_home;
    std::optional<fs::path> home;
    fs::path working_dir; ///< base for a relative `core.excludesFile`
};

/**
 * @brief Build an @ref ExcludesLookup from git configuration and environment.
 */
ExcludesLookup current_excludes_lookup();

fs::path repository_ignore_path(const GitContext& ctx);
fs::path local_exclude_path(const GitContext& ctx);

/**
 * @brief Locate the global excludes file.
 *
 * A configured `core.excludesFile` wins even if the file does not exist yet;
 * relative values are taken relative to the working directory. Otherwise the
 * default `$XDG_CONFIG_HOME/git/ignore` (or `~/.config/git/ignore`) is used,
 * but only when that file already exists.
 *
 * @throws IgnoreError with ErrorKind::Configuration when nothing is found.
 */
fs::path global_excludes_path(const ExcludesLookup& lookup);

/**
 * @brief Map a @ref TargetKind to the file it designates.
 *
 * The resolver is only consulted for the repository-bound targets.
 */
fs::path resolve_target_path(TargetKind kind, GitContextResolver& resolver,
                             const ExcludesLookup& lookup);

/** @return Human readable description such as `repository .gitignore (/x/.gitignore)`. */
std::string target_description(TargetKind kind, const fs::path& path);

} // namespace git_context

#endif // GIT_CONTEXT_HPP
