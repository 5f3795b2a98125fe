#ifndef PATTERN_VALIDATOR_HPP
#define PATTERN_VALIDATOR_HPP
#include <string>
#include <vector>

namespace validation {

enum class Severity { Error, Warning, Info };

/**
 * @brief A single advisory result for one pattern.
 *
 * Only @ref Severity::Error blocks a request.
 */
struct ValidationFinding {
    std::string pattern;
    Severity severity;
    std::string message;
};

/**
 * @brief Heuristic pattern lists consulted by the validator.
 *
 * Both lists match the trimmed pattern exactly.
 */
struct ValidationPolicy {
    std::vector<std::string> broad_patterns{"*", "**", "/"};
    std::vector<std::string> protected_patterns{".git", ".gitignore", "README*", "LICENSE*"};
};

/**
 * @brief Classify a single pattern.
 *
 * An Error finding (blank pattern or embedded line break) is returned alone;
 * the remaining checks only run for patterns that can be written.
 */
std::vector<ValidationFinding> validate_pattern(const std::string& pattern,
                                                const ValidationPolicy& policy = {});

/** @brief Validate @a patterns in order and concatenate their findings. */
std::vector<ValidationFinding> validate_patterns(const std::vector<std::string>& patterns,
                                                 const ValidationPolicy& policy = {});

bool has_blocking_findings(const std::vector<ValidationFinding>& findings);

const char* severity_label(Severity severity);

} // namespace validation

#endif // PATTERN_VALIDATOR_HPP
