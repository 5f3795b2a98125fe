#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Failure categories surfaced by the resolver, the store and the
 * request orchestrator.
 */
enum class ErrorKind { NotAGitRepository, Configuration, Validation, Io, Interrupted, Unexpected };

constexpr int EXIT_OK = 0;
constexpr int EXIT_VALIDATION_FAILED = 1;
constexpr int EXIT_GIT_ERROR = 2;
constexpr int EXIT_CONFIG_ERROR = 3;
constexpr int EXIT_FILE_ERROR = 4;
constexpr int EXIT_INTERRUPTED = 130;
constexpr int EXIT_UNEXPECTED = 255;
constexpr int EXIT_USAGE = 2;

/**
 * @brief Exception carrying an @ref ErrorKind and the path that was being
 * worked on when the failure happened (empty when not applicable).
 */
class IgnoreError : public std::runtime_error {
  public:
    IgnoreError(ErrorKind kind, const std::string& message, std::filesystem::path path = {})
        : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    ErrorKind kind_;
    std::filesystem::path path_;
};

/** @return Process exit code for a failure of the given kind. */
inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotAGitRepository:
        return EXIT_GIT_ERROR;
    case ErrorKind::Configuration:
        return EXIT_CONFIG_ERROR;
    case ErrorKind::Validation:
        return EXIT_VALIDATION_FAILED;
    case ErrorKind::Io:
        return EXIT_FILE_ERROR;
    case ErrorKind::Interrupted:
        return EXIT_INTERRUPTED;
    case ErrorKind::Unexpected:
        break;
    }
    return EXIT_UNEXPECTED;
}

/** @return Short label used when printing a failure of the given kind. */
inline const char* error_kind_label(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotAGitRepository:
        return "Git error while determining target file";
    case ErrorKind::Configuration:
        return "Configuration error";
    case ErrorKind::Validation:
        return "Pattern validation failed";
    case ErrorKind::Io:
        return "File system error";
    case ErrorKind::Interrupted:
        return "Interrupted";
    case ErrorKind::Unexpected:
        break;
    }
    return "Unexpected error";
}

#endif // ERRORS_HPP
