#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::mutex g_log_mtx;
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};

static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    return true;
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        out = LogLevel::DEBUG;
    else if (val == "INFO")
        out = LogLevel::INFO;
    else if (val == "WARNING" || val == "WARN")
        out = LogLevel::WARNING;
    else if (val == "ERROR")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            ok = false;
            break;
        }
    }
    return gzclose(out) == Z_OK && ok;
}

static std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static std::string format_entry(LogLevel level, const std::string& msg,
                                const std::map<std::string, std::string>& fields) {
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(level) +
               "\",\"msg\":\"" + json_escape(msg) + "\"";
        for (const auto& [k, v] : fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(level) + "] " + msg;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    return line;
}

// Shift name.1 -> name.2 ... and move the active file to name.1. Caller holds
// g_log_mtx and has closed the stream.
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    if (keep == 0) {
        fs::remove(g_log_path, ec);
        return;
    }
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep) {
            fs::remove(src, ec);
        } else {
            fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
            fs::rename(src, dst, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs.load()) {
        fs::path gz = first;
        gz += ".gz";
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
    }
}

static void write_entry(LogLevel level, const std::string& msg,
                        const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open())
        return;
    g_log_ofs << format_entry(level, msg, fields) << '\n';
    g_log_ofs.flush();
    if (g_max_size.load() == 0)
        return;
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size.load())
        return;
    g_log_ofs.close();
    rotate_files();
    g_log_ofs.clear();
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void log_debug(const std::string& msg) { write_entry(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { write_entry(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { write_entry(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { write_entry(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
}
