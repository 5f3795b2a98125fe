#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

const std::set<std::string>& known_flags() {
    static const std::set<std::string> known{
        "--local",       "--global",      "--no-validate",  "--allow-duplicates",
        "--version",     "--help",        "--config-yaml",  "--config-json",
        "--auto-config", "--log-file",    "--log-level",    "--verbose",
        "--json-log",    "--max-log-size", "--compress-logs"};
    return known;
}

const std::set<std::string>& switch_flags() {
    static const std::set<std::string> switches{
        "--local",       "--global",  "--no-validate", "--allow-duplicates", "--version",
        "--help",        "--verbose", "--json-log",    "--compress-logs",    "--auto-config"};
    return switches;
}

const std::map<char, std::string>& short_flags() {
    static const std::map<char, std::string> shorts{{'l', "--local"},       {'g', "--global"},
                                                    {'v', "--version"},     {'h', "--help"},
                                                    {'y', "--config-yaml"}, {'j', "--config-json"}};
    return shorts;
}

// Keys a configuration file may set. Help, version and the config selectors
// only make sense on the command line.
static const std::set<std::string>& config_keys() {
    static const std::set<std::string> keys{
        "--local",        "--global",         "--no-validate",       "--allow-duplicates",
        "--log-file",     "--log-level",      "--verbose",           "--json-log",
        "--max-log-size", "--compress-logs",  "--broad-patterns",    "--protected-patterns"};
    return keys;
}

static std::vector<std::string> split_lines(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream iss(value);
    std::string line;
    while (std::getline(iss, line)) {
        line.erase(line.begin(), std::find_if(line.begin(), line.end(),
                                              [](unsigned char c) { return !std::isspace(c); }));
        line.erase(std::find_if(line.rbegin(), line.rend(),
                                [](unsigned char c) { return !std::isspace(c); })
                       .base(),
                   line.end());
        if (!line.empty())
            out.push_back(line);
    }
    return out;
}

Options parse_options(int argc, char* argv[]) {
    fs::path config_file;
    std::map<std::string, std::string> cfg_opts;
    load_config_and_auto(argc, argv, cfg_opts, config_file);

    ArgParser parser(argc, argv, known_flags(), short_flags(), switch_flags());
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    for (const auto& kv : cfg_opts) {
        if (!config_keys().count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k + " in config: " + it->second);
        return v;
    };
    // Command line first, then configuration. Throws when the flag is present
    // without a value.
    auto value_of = [&](const std::string& k) {
        std::string val;
        if (parser.has_flag(k))
            val = parser.get_option(k);
        else if (cfg_opts.count(k))
            val = cfg_opts.at(k);
        if (val.empty())
            throw std::runtime_error(k + " requires a value");
        return val;
    };
    auto present = [&](const std::string& k) {
        return parser.has_flag(k) || cfg_opts.count(k) > 0;
    };

    Options opts;
    opts.config_file = config_file;
    opts.show_help = parser.has_flag("--help");
    opts.show_version = parser.has_flag("--version");
    opts.auto_config = parser.has_flag("--auto-config");

    bool local = parser.has_flag("--local");
    bool global = parser.has_flag("--global");
    if (!local && !global) {
        local = cfg_flag("--local");
        global = cfg_flag("--global");
    }
    if (local && global)
        throw std::runtime_error("--local and --global cannot be used together");
    if (local)
        opts.target = git_context::TargetKind::Local;
    else if (global)
        opts.target = git_context::TargetKind::Global;

    opts.validate = !(parser.has_flag("--no-validate") || cfg_flag("--no-validate"));
    opts.allow_duplicates =
        parser.has_flag("--allow-duplicates") || cfg_flag("--allow-duplicates");

    if (cfg_opts.count("--broad-patterns"))
        opts.policy.broad_patterns = split_lines(cfg_opts.at("--broad-patterns"));
    if (cfg_opts.count("--protected-patterns"))
        opts.policy.protected_patterns = split_lines(cfg_opts.at("--protected-patterns"));

    if (present("--log-file"))
        opts.logging.log_file = value_of("--log-file");
    if (parser.has_flag("--verbose") || cfg_flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (present("--log-level")) {
        std::string val = value_of("--log-level");
        if (!parse_log_level(val, opts.logging.log_level))
            throw std::runtime_error("Invalid log level: " + val);
    }
    opts.logging.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    opts.logging.compress_logs =
        parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
    if (present("--max-log-size")) {
        bool ok = false;
        opts.logging.max_log_size = parse_bytes(value_of("--max-log-size"), 1, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }

    opts.patterns = parser.positional();
    if (opts.patterns.empty() && !opts.show_help && !opts.show_version)
        throw std::runtime_error("At least one pattern is required");
    return opts;
}
