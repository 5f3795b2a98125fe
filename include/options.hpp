#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "git_context.hpp"
#include "logger.hpp"
#include "pattern_validator.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

/**
 * @brief Fully parsed invocation.
 *
 * Built from the command line merged with an optional configuration file;
 * command-line values take precedence.
 */
struct Options {
    std::vector<std::string> patterns;
    git_context::TargetKind target = git_context::TargetKind::Repository;
    bool validate = true;
    bool allow_duplicates = false;
    bool show_help = false;
    bool show_version = false;
    bool auto_config = false;
    std::filesystem::path config_file;
    validation::ValidationPolicy policy;
    LoggingOptions logging;
};

/** @return Long flags accepted on the command line. */
const std::set<std::string>& known_flags();

/** @return Long flags that are switches and never take a value. */
const std::set<std::string>& switch_flags();

/** @return Mapping of short options to their long form. */
const std::map<char, std::string>& short_flags();

/**
 * @brief Parse command line arguments into an Options structure.
 *
 * @throws std::runtime_error describing the first usage error found (unknown
 *         flag, conflicting targets, missing pattern, invalid value or an
 *         unreadable configuration file).
 */
Options parse_options(int argc, char* argv[]);

/**
 * Load configuration from an explicit file (`--config-yaml` / `--config-json`)
 * and, when `--auto-config` is given, from `.git-ignore.yaml` or
 * `.git-ignore.json` in the current directory or next to the executable.
 *
 * @param argc        Argument count from `main`.
 * @param argv        Argument vector from `main`.
 * @param cfg_opts    Receives the flattened `--key` entries.
 * @param config_file Receives the path of the file that was loaded, if any.
 */
void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

#endif // OPTIONS_HPP
