/**
 * @file git_ignore.cpp
 * @brief CLI entry point for adding patterns to git ignore files.
 *
 * Parses the command line, sets up logging and hands the request to the
 * orchestrator in cli_commands.cpp.
 */

#include <filesystem>
#include <iostream>

#include "cli_commands.hpp"
#include "errors.hpp"
#include "git_context.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "system_utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

#ifndef GIT_IGNORE_NO_MAIN
static bool setup_logging(const LoggingOptions& logging) {
    if (logging.log_file.empty())
        return true;
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    return init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                       logging.max_log_files);
}

/**
 * @brief Application entry point.
 *
 * @return 0 on success or when printing help/version, otherwise one of the
 *         EXIT_* codes from errors.hpp.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    procutil::install_interrupt_handler();
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "git-ignore: " << e.what() << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return EXIT_USAGE;
    }
    if (opts.show_help) {
        print_help(std::cout, argv[0]);
        return EXIT_OK;
    }
    if (opts.show_version) {
        std::cout << "git-ignore " << GIT_IGNORE_VERSION << "\n";
        return EXIT_OK;
    }
    if (!setup_logging(opts.logging))
        std::cerr << "Warning: could not open log file " << opts.logging.log_file << "\n";

    int rc = EXIT_UNEXPECTED;
    try {
        cli::RunEnvironment env{fs::current_path(), git_context::current_excludes_lookup()};
        log_debug("Starting", {{"version", GIT_IGNORE_VERSION},
                               {"config", opts.config_file.string()},
                               {"cwd", env.start_dir.string()}});
        rc = cli::run(opts, env, std::cout, std::cerr);
    } catch (const std::exception& e) {
        log_error("Unexpected error", {{"error", e.what()}});
        std::cerr << "Unexpected error: " << e.what() << "\n";
        rc = EXIT_UNEXPECTED;
    }
    if (rc == EXIT_INTERRUPTED)
        std::cerr << "\nOperation cancelled by user\n";
    shutdown_logger();
    return rc;
}
#endif // GIT_IGNORE_NO_MAIN
