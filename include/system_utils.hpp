#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <optional>
#include <string>
#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief Read an environment variable.
 *
 * @return The value, or `std::nullopt` when unset. An empty value is returned
 *         as an empty string.
 */
std::optional<std::string> safe_getenv(const char* name);

/**
 * @brief Locate the current user's home directory.
 *
 * Uses `HOME` (and `USERPROFILE` on Windows).
 */
std::optional<std::filesystem::path> home_directory();

/** @return Identifier of the running process. */
unsigned long current_pid();

/**
 * @brief Install SIGINT/SIGTERM handlers that only record the interrupt.
 *
 * Long running steps poll @ref interrupt_requested() at safe points instead
 * of being torn down mid-write.
 */
void install_interrupt_handler();

/** @return `true` once an interrupt signal has been received. */
bool interrupt_requested();

/** Mark the process as interrupted, as the signal handler would. */
void request_interrupt();

/** Reset the interrupt flag. */
void clear_interrupt();

/**
 * @brief Flush a file's data to stable storage.
 *
 * @return `false` if the file could not be opened or synced.
 */
bool sync_file(const std::filesystem::path& file);

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    void reset(int f = -1) noexcept {
        if (fd >= 0) {
#ifdef _WIN32
            _close(fd);
#else
            close(fd);
#endif
        }
        fd = f;
    }

  private:
    int fd;
};

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
