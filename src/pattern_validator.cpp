#include "pattern_validator.hpp"
#include <algorithm>
#include <cctype>

namespace validation {

namespace {

std::string trimmed(const std::string& s) {
    auto first =
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base();
    if (first >= last)
        return {};
    return std::string(first, last);
}

bool listed(const std::vector<std::string>& list, const std::string& pattern) {
    return std::find(list.begin(), list.end(), pattern) != list.end();
}

size_t count_double_star(const std::string& s) {
    size_t count = 0;
    size_t pos = s.find("**");
    while (pos != std::string::npos) {
        ++count;
        pos = s.find("**", pos + 2);
    }
    return count;
}

} // namespace

std::vector<ValidationFinding> validate_pattern(const std::string& pattern,
                                                const ValidationPolicy& policy) {
    std::vector<ValidationFinding> findings;
    if (pattern.find_first_of("\r\n") != std::string::npos) {
        findings.push_back({pattern, Severity::Error,
                            "Pattern contains newline characters which would corrupt the "
                            "ignore file"});
        return findings;
    }
    const std::string p = trimmed(pattern);
    if (p.empty()) {
        findings.push_back({pattern, Severity::Error, "Pattern is empty"});
        return findings;
    }

    if (listed(policy.broad_patterns, p))
        findings.push_back(
            {p, Severity::Warning, "Pattern is very broad and may ignore more than intended"});
    if (count_double_star(p) > 1)
        findings.push_back(
            {p, Severity::Warning, "Pattern has multiple '**' which may not work as expected"});
    if (listed(policy.protected_patterns, p))
        findings.push_back({p, Severity::Warning, "Pattern may ignore important files"});
    if (p.rfind("./", 0) == 0)
        findings.push_back({p, Severity::Info, "Pattern starts with './' which is redundant"});
    if (p.size() > 2 && p.front() == '/' && p.back() == '/')
        findings.push_back({p, Severity::Info,
                            "Pattern has leading and trailing slashes and might be too "
                            "restrictive"});
    return findings;
}

std::vector<ValidationFinding> validate_patterns(const std::vector<std::string>& patterns,
                                                 const ValidationPolicy& policy) {
    std::vector<ValidationFinding> all;
    for (const auto& p : patterns) {
        auto f = validate_pattern(p, policy);
        all.insert(all.end(), f.begin(), f.end());
    }
    return all;
}

bool has_blocking_findings(const std::vector<ValidationFinding>& findings) {
    return std::any_of(findings.begin(), findings.end(),
                       [](const ValidationFinding& f) { return f.severity == Severity::Error; });
}

const char* severity_label(Severity severity) {
    switch (severity) {
    case Severity::Error:
        return "ERROR";
    case Severity::Warning:
        return "WARNING";
    case Severity::Info:
        return "INFO";
    }
    return "INFO";
}

} // namespace validation
