#include "test_common.hpp"
#include <csignal>
#include "system_utils.hpp"
#ifndef _WIN32
#include <fcntl.h>
#include <cerrno>
#include <unistd.h>
#endif

using git_ignore::test_support::TempDir;
using git_ignore::test_support::write_file;

TEST_CASE("UniqueFd releases descriptor") {
#ifndef _WIN32
    int raw = -1;
    {
        procutil::UniqueFd fd(::open("/dev/null", O_RDONLY));
        REQUIRE(fd);
        raw = fd.get();
    }
    errno = 0;
    REQUIRE(::close(raw) == -1);
    REQUIRE(errno == EBADF);
#else
    SUCCEED();
#endif
}

TEST_CASE("UniqueFd move transfers ownership") {
#ifndef _WIN32
    procutil::UniqueFd a(::open("/dev/null", O_RDONLY));
    int raw = a.get();
    procutil::UniqueFd b(std::move(a));
    REQUIRE_FALSE(a);
    REQUIRE(b.get() == raw);
#else
    SUCCEED();
#endif
}

TEST_CASE("safe_getenv distinguishes unset and empty") {
    setenv("GIT_IGNORE_TEST_VAR", "value", 1);
    REQUIRE(procutil::safe_getenv("GIT_IGNORE_TEST_VAR") == std::string("value"));
    unsetenv("GIT_IGNORE_TEST_VAR");
    REQUIRE_FALSE(procutil::safe_getenv("GIT_IGNORE_TEST_VAR").has_value());
}

TEST_CASE("home_directory follows HOME") {
#ifndef _WIN32
    auto saved = procutil::safe_getenv("HOME");
    setenv("HOME", "/tmp/some-home", 1);
    REQUIRE(procutil::home_directory() == fs::path("/tmp/some-home"));
    setenv("HOME", "", 1);
    REQUIRE_FALSE(procutil::home_directory().has_value());
    if (saved)
        setenv("HOME", saved->c_str(), 1);
    else
        unsetenv("HOME");
#else
    SUCCEED();
#endif
}

TEST_CASE("Interrupt flag can be raised and cleared") {
    procutil::clear_interrupt();
    REQUIRE_FALSE(procutil::interrupt_requested());
    procutil::request_interrupt();
    REQUIRE(procutil::interrupt_requested());
    procutil::clear_interrupt();
    REQUIRE_FALSE(procutil::interrupt_requested());
}

TEST_CASE("Installed handler records SIGINT") {
#ifndef _WIN32
    procutil::clear_interrupt();
    procutil::install_interrupt_handler();
    REQUIRE(std::raise(SIGINT) == 0);
    REQUIRE(procutil::interrupt_requested());
    procutil::clear_interrupt();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#else
    SUCCEED();
#endif
}

TEST_CASE("sync_file succeeds for existing files only") {
    TempDir dir("sys_sync");
    fs::path file = dir.path() / "data";
    write_file(file, "x");
    REQUIRE(procutil::sync_file(file));
    REQUIRE_FALSE(procutil::sync_file(dir.path() / "missing"));
}

TEST_CASE("current_pid is stable") { REQUIRE(procutil::current_pid() == procutil::current_pid()); }
