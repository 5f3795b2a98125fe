// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

static void load_config_file(const fs::path& cfg, bool yaml,
                             std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = yaml ? load_yaml_config(cfg.string(), cfg_opts, err)
                   : load_json_config(cfg.string(), cfg_opts, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + cfg.string() + ": " + err);
}

void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          fs::path& config_file) {
    ArgParser pre_parser(argc, argv, known_flags(), short_flags(), switch_flags());
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        load_config_file(cfg, true, cfg_opts);
        config_file = cfg;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        load_config_file(cfg, false, cfg_opts);
        config_file = cfg;
    }

    if (!pre_parser.has_flag("--auto-config") || !config_file.empty())
        return;
    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        std::error_code ec;
        fs::path y = dir / ".git-ignore.yaml";
        if (fs::exists(y, ec))
            return y;
        fs::path j = dir / ".git-ignore.json";
        if (fs::exists(j, ec))
            return j;
        return {};
    };
    fs::path exe_dir;
    if (argv && argv[0])
        exe_dir = fs::absolute(argv[0]).parent_path();
    fs::path cfg_path = find_cfg(fs::current_path());
    if (cfg_path.empty())
        cfg_path = find_cfg(exe_dir);
    if (cfg_path.empty())
        return;
    load_config_file(cfg_path, cfg_path.extension() == ".yaml", cfg_opts);
    config_file = cfg_path;
}
