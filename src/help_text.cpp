#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(std::ostream& os, const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--local", "-l", "", "Add to .git/info/exclude instead of .gitignore", "Target"},
        {"--global", "-g", "", "Add to the global gitignore (core.excludesFile)", "Target"},
        {"--no-validate", "", "", "Skip pattern validation", "Patterns"},
        {"--allow-duplicates", "", "", "Append patterns even if already present", "Patterns"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Auto detect .git-ignore.yaml or .git-ignore.json", "Config"},
        {"--log-file", "", "<path>", "Write a log file", "Logging"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "", "", "Shortcut for --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size (K/M/G suffix)",
         "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--version", "-v", "", "Show version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "git-ignore - Add patterns to git ignore files\n";
    os << "Appends patterns to .gitignore, .git/info/exclude or the global gitignore,\n";
    os << "skipping patterns that are already present.\n\n";
    os << "Usage: " << prog << " [options] <pattern>...\n";
    os << "       " << prog << " [options] -- <pattern>...\n\n";
    const std::vector<std::string> order{"Target", "Patterns", "Config", "Logging", "Basics"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat]) {
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o) << o->desc
               << "\n";
        }
        os << "\n";
    }
    os << "Examples:\n";
    os << "  " << prog << " \"*.pyc\" __pycache__/\n";
    os << "  " << prog << " --local .env\n";
    os << "  " << prog << " --global .DS_Store\n\n";
    os << "Exit codes: 0 success, 1 invalid pattern, 2 git or usage error,\n";
    os << "3 global gitignore not configured, 4 file error, 130 interrupted.\n";
}
