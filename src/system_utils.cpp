#include "system_utils.hpp"
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <process.h>
#endif

namespace procutil {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_interrupt(int) { g_interrupted = 1; }

} // namespace

std::optional<std::string> safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        std::string v(buf);
        free(buf);
        return v;
    }
    return std::nullopt;
#else
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
#endif
}

std::optional<std::filesystem::path> home_directory() {
    auto home = safe_getenv("HOME");
#ifdef _WIN32
    if (!home || home->empty())
        home = safe_getenv("USERPROFILE");
#endif
    if (!home || home->empty())
        return std::nullopt;
    return std::filesystem::path(*home);
}

unsigned long current_pid() {
#ifdef _WIN32
    return static_cast<unsigned long>(_getpid());
#else
    return static_cast<unsigned long>(getpid());
#endif
}

void install_interrupt_handler() {
    std::signal(SIGINT, handle_interrupt);
#ifndef _WIN32
    std::signal(SIGTERM, handle_interrupt);
#endif
}

bool interrupt_requested() { return g_interrupted != 0; }

void request_interrupt() { g_interrupted = 1; }

void clear_interrupt() { g_interrupted = 0; }

bool sync_file(const std::filesystem::path& file) {
#ifdef _WIN32
    UniqueFd fd(_open(file.string().c_str(), _O_RDWR));
    if (!fd)
        return false;
    return _commit(fd.get()) == 0;
#else
    UniqueFd fd(open(file.c_str(), O_RDONLY));
    if (!fd)
        return false;
    return fsync(fd.get()) == 0;
#endif
}

} // namespace procutil
