#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ignore {

/**
 * @brief Outcome of one append transaction.
 *
 * `added` and `skipped_duplicates` keep the order in which candidates were
 * supplied. `created` is set when the target file did not exist before and
 * was written by this call.
 */
struct AppendReport {
    std::vector<std::string> added;
    std::vector<std::string> skipped_duplicates;
    std::size_t dropped_blank = 0; ///< candidates that normalized to empty
    std::filesystem::path target_path;
    bool created = false;
};

/// Called with the staged temporary file right before it replaces the target.
using ReplaceHook = std::function<void(const std::filesystem::path&)>;

/**
 * Read the pattern entries of an ignore file.
 *
 * Each non-empty, non-comment line in the file is trimmed of leading and
 * trailing whitespace and treated as a distinct pattern. Lines beginning
 * with '#' are considered comments and skipped. If a line ends with a carriage
 * return (`\r`), it is stripped before processing.
 *
 * A missing file yields an empty list.
 *
 * @throws IgnoreError (ErrorKind::Io) when the file exists but cannot be read.
 */
std::vector<std::string> read_ignore_file(const std::filesystem::path& file);

/** @brief Strip line breaks and surrounding whitespace from a candidate. */
std::string normalize_pattern(const std::string& raw);

/**
 * @brief Append patterns to an ignore file atomically.
 *
 * Existing content is kept byte for byte. Candidates already present in the
 * file, or repeated earlier in the same batch, are reported as skipped unless
 * @a allow_duplicates is set. When nothing is left to add the file is not
 * touched.
 *
 * @throws IgnoreError (ErrorKind::Io or ErrorKind::Interrupted); the target is
 *         unchanged in either case.
 */
AppendReport append_patterns(const std::filesystem::path& target,
                             const std::vector<std::string>& candidates,
                             bool allow_duplicates = false,
                             const ReplaceHook& before_replace = {});

/**
 * @brief Replace @a target with @a content via a temporary file and rename.
 *
 * The content is staged as `<target>.<pid>.tmp` beside the target, synced and
 * renamed over it. When @a target is a symbolic link the file it points to is
 * replaced and the link is kept. Missing parent directories are created. If an
 * interrupt is pending when the rename is due, the staged file is removed and
 * ErrorKind::Interrupted is thrown.
 */
void write_file_atomic(const std::filesystem::path& target, const std::string& content,
                       const ReplaceHook& before_replace = {});

/**
 * @brief Create git's default `info/exclude` file if it is missing.
 *
 * @return `true` when the file was created.
 */
bool ensure_exclude_file(const std::filesystem::path& path);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
