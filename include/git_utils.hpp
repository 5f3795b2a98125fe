#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using config_ptr = GitHandle<git_config, git_config_free>;

/**
 * @brief Where libgit2 found a repository.
 *
 * All paths are absolute and canonical, without trailing separators.
 * `work_tree` is empty for bare repositories.
 */
struct RepoLocation {
    fs::path work_tree;
    fs::path git_dir;
    fs::path common_dir;
    bool bare = false;
};

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Discover the repository enclosing @a start.
 *
 * Walks upward from @a start like `git rev-parse` does, following gitlink
 * files (submodules) and worktree indirection.
 *
 * @param start Directory to start searching from.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Location of the repository or `std::nullopt` when none encloses
 *         @a start.
 */
std::optional<RepoLocation> discover_repository(const fs::path& start,
                                                std::string* error = nullptr);

/**
 * @brief Read a path-valued key from the user's git configuration.
 *
 * Consults the global, XDG and system configuration files; a leading `~/`
 * is expanded by libgit2.
 *
 * @param key   Configuration key such as `core.excludesFile`.
 * @param error Optional output string receiving a libgit2 error message when
 *              the configuration could not be read (unset keys are not
 *              errors).
 * @return The configured path or `std::nullopt` when unset.
 */
std::optional<fs::path> read_config_path(const std::string& key, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
