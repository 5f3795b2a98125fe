#include <zlib.h>
#include <fstream>
#include <string>
#include <vector>
#include <filesystem>
#include "test_common.hpp"
#include "logger.hpp"

using git_ignore::test_support::TempDir;

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_json_logging(false);
        set_log_compression(false);
        set_log_level(LogLevel::INFO);
    }
};

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

TEST_CASE("Logger rotates and limits files") {
    TempDir dir("logger_rotate");
    fs::path log = dir.path() / "rotate.log";
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(dir.path() / "rotate.log.1"));
    REQUIRE(fs::exists(dir.path() / "rotate.log.2"));
    REQUIRE_FALSE(fs::exists(dir.path() / "rotate.log.3"));
}

TEST_CASE("Logger compresses rotated files") {
    TempDir dir("logger_compress");
    fs::path log = dir.path() / "compress.log";
    fs::path log1 = dir.path() / "compress.log.1.gz";
    LoggerGuard guard;
    set_log_compression(true);
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(dir.path() / "compress.log.2.gz"));
    REQUIRE_FALSE(fs::exists(dir.path() / "compress.log.1"));

    gzFile zf = gzopen(log1.string().c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);
    REQUIRE(std::string(buf, 1) == "[");
}

TEST_CASE("Logger switches between JSON and plain") {
    TempDir dir("logger_format");
    fs::path log = dir.path() / "format.log";
    LoggerGuard guard;
    REQUIRE(init_logger(log.string()));
    set_json_logging(true);
    log_info("json \"entry\"", {{"k", "v"}});
    set_json_logging(false);
    log_warning("plain entry", {{"path", "/tmp/x"}});
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0][0] == '{');
    REQUIRE(lines[0].find("\"level\":\"INFO\"") != std::string::npos);
    REQUIRE(lines[0].find("\"msg\":\"json \\\"entry\\\"\"") != std::string::npos);
    REQUIRE(lines[0].find("\"k\":\"v\"") != std::string::npos);
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[WARNING] plain entry path=/tmp/x") != std::string::npos);
}

TEST_CASE("Logger filters below the minimum level") {
    TempDir dir("logger_level");
    fs::path log = dir.path() / "level.log";
    LoggerGuard guard;
    REQUIRE(init_logger(log.string(), LogLevel::WARNING));
    log_debug("hidden");
    log_info("hidden");
    log_warning("shown");
    log_error("shown too");
    set_log_level(LogLevel::DEBUG);
    log_debug("now visible");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[1].find("[ERROR]") != std::string::npos);
    REQUIRE(lines[2].find("[DEBUG]") != std::string::npos);
}

TEST_CASE("Logging before init is a no-op") {
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    log_error("nowhere");
    REQUIRE_FALSE(logger_initialized());
}

TEST_CASE("init_logger creates parent directories and appends") {
    TempDir dir("logger_reinit");
    fs::path log = dir.path() / "nested" / "dir" / "reinit.log";
    LoggerGuard guard;
    REQUIRE(init_logger(log.string()));
    log_info("first entry");
    REQUIRE(init_logger(log.string()));
    log_info("second entry");
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 2);
}

TEST_CASE("init_logger reports unopenable paths") {
    TempDir dir("logger_bad");
    LoggerGuard guard;
    REQUIRE_FALSE(init_logger(dir.path().string()));
    REQUIRE_FALSE(logger_initialized());
}

TEST_CASE("parse_log_level accepts known names") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("debug", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("Warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("loud", level));
    REQUIRE(level == LogLevel::ERR);
}
