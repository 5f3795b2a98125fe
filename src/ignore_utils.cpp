#include "ignore_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include "errors.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace {

const char* const kExcludeTemplate =
    "# git ls-files --others --exclude-from=.git/info/exclude\n"
    "# Lines that start with '#' are comments.\n"
    "# For a project mostly in C, the following would be a good set of\n"
    "# exclude patterns (uncomment them if you want to use them):\n"
    "# *.[oa]\n"
    "# *~\n";

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

// Returns std::nullopt when the file does not exist.
std::optional<std::string> read_raw(const fs::path& file) {
    std::error_code ec;
    auto st = fs::status(file, ec);
    if (st.type() == fs::file_type::not_found)
        return std::nullopt;
    if (ec)
        throw IgnoreError(ErrorKind::Io, "Cannot access " + file.string() + ": " + ec.message(),
                          file);
    if (fs::is_directory(st))
        throw IgnoreError(ErrorKind::Io, file.string() + " is a directory", file);
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs)
        throw IgnoreError(ErrorKind::Io, "Cannot read " + file.string(), file);
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw IgnoreError(ErrorKind::Io, "Error while reading " + file.string(), file);
    return content;
}

std::vector<std::string> pattern_lines(const std::string& content) {
    std::vector<std::string> entries;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.push_back(line);
    }
    return entries;
}

constexpr int kMaxSymlinkHops = 40;

// Follows a chain of symbolic links so the file they name gets replaced
// instead of the link itself. A dangling link yields the path it points to.
fs::path follow_symlinks(const fs::path& target) {
    fs::path p = target;
    for (int hops = 0; hops < kMaxSymlinkHops; ++hops) {
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(p, ec)))
            return p;
        fs::path next = fs::read_symlink(p, ec);
        if (ec)
            throw IgnoreError(ErrorKind::Io,
                              "Cannot read link " + p.string() + ": " + ec.message(), p);
        p = next.is_absolute() ? next : p.parent_path() / next;
    }
    throw IgnoreError(ErrorKind::Io, "Too many levels of symbolic links: " + target.string(),
                      target);
}

fs::path staging_path(const fs::path& target) {
    fs::path tmp = target;
    tmp += "." + std::to_string(procutil::current_pid()) + ".tmp";
    return tmp;
}

} // namespace

namespace ignore {

std::vector<std::string> read_ignore_file(const std::filesystem::path& file) {
    auto content = read_raw(file);
    if (!content)
        return {};
    return pattern_lines(*content);
}

std::string normalize_pattern(const std::string& raw) {
    std::string s;
    s.reserve(raw.size());
    std::copy_if(raw.begin(), raw.end(), std::back_inserter(s),
                 [](char c) { return c != '\n' && c != '\r'; });
    trim(s);
    return s;
}

AppendReport append_patterns(const std::filesystem::path& target,
                             const std::vector<std::string>& candidates, bool allow_duplicates,
                             const ReplaceHook& before_replace) {
    AppendReport report;
    report.target_path = target;

    auto existing = read_raw(target);
    const bool existed = existing.has_value();
    std::string content = existed ? *existing : std::string();

    std::set<std::string> seen;
    if (!allow_duplicates) {
        auto lines = pattern_lines(content);
        seen.insert(lines.begin(), lines.end());
    }
    for (const auto& raw : candidates) {
        std::string p = normalize_pattern(raw);
        if (p.empty()) {
            ++report.dropped_blank;
            continue;
        }
        if (!allow_duplicates && !seen.insert(p).second) {
            report.skipped_duplicates.push_back(p);
            continue;
        }
        report.added.push_back(p);
    }

    if (report.added.empty()) {
        log_debug("Nothing to append", {{"target", target.string()},
                                        {"skipped", std::to_string(
                                                        report.skipped_duplicates.size())}});
        return report;
    }

    if (!content.empty() && content.back() != '\n')
        content += '\n';
    for (const auto& p : report.added)
        content += p + '\n';

    write_file_atomic(target, content, before_replace);
    report.created = !existed;
    log_info("Appended patterns", {{"target", target.string()},
                                   {"added", std::to_string(report.added.size())},
                                   {"skipped", std::to_string(report.skipped_duplicates.size())},
                                   {"created", report.created ? "true" : "false"}});
    return report;
}

void write_file_atomic(const std::filesystem::path& link, const std::string& content,
                       const ReplaceHook& before_replace) {
    const fs::path target = follow_symlinks(link);
    if (target != link)
        log_debug("Writing through symbolic link", {{"link", link.string()},
                                                    {"target", target.string()}});
    std::error_code ec;
    fs::path parent = target.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec)
            throw IgnoreError(ErrorKind::Io,
                              "Cannot create directory " + parent.string() + ": " + ec.message(),
                              parent);
    }

    const fs::path tmp = staging_path(target);
    try {
        {
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (!ofs)
                throw IgnoreError(ErrorKind::Io, "Cannot create " + tmp.string(), tmp);
            ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            ofs.flush();
            if (!ofs)
                throw IgnoreError(ErrorKind::Io, "Cannot write " + tmp.string(), tmp);
        }
        if (!procutil::sync_file(tmp))
            log_warning("Could not sync staged file", {{"path", tmp.string()}});

        auto st = fs::status(target, ec);
        if (!ec && fs::exists(st))
            fs::permissions(tmp, st.permissions(), ec);

        if (before_replace)
            before_replace(tmp);
        if (procutil::interrupt_requested())
            throw IgnoreError(ErrorKind::Interrupted,
                              "Interrupted before " + target.string() + " was replaced", target);

        fs::rename(tmp, target, ec);
        if (ec)
            throw IgnoreError(ErrorKind::Io,
                              "Cannot replace " + target.string() + ": " + ec.message(), target);
    } catch (...) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw;
    }
}

bool ensure_exclude_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec))
        return false;
    write_file_atomic(path, kExcludeTemplate);
    log_info("Created exclude file", {{"path", path.string()}});
    return true;
}

} // namespace ignore
