#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "git_context.hpp"
#include "ignore_utils.hpp"
#include "options.hpp"
#include "pattern_validator.hpp"

namespace cli {

/**
 * @brief The part of @ref Options that drives one append.
 */
struct Request {
    std::vector<std::string> patterns;
    git_context::TargetKind target = git_context::TargetKind::Repository;
    bool validate = true;
    bool allow_duplicates = false;
    validation::ValidationPolicy policy;
};

/**
 * @brief Everything a caller needs to render the outcome of a request.
 *
 * When `blocked` is set an Error finding stopped the request before any
 * path was resolved; `target_path` and `append` are then empty.
 */
struct RunReport {
    std::vector<validation::ValidationFinding> findings;
    bool blocked = false;
    git_context::TargetKind target_kind = git_context::TargetKind::Repository;
    std::filesystem::path target_path;
    ignore::AppendReport append;
};

/**
 * @brief Process-level inputs, injectable for tests.
 */
struct RunEnvironment {
    std::filesystem::path start_dir;
    git_context::ExcludesLookup lookup;
};

Request make_request(const Options& opts);

using FindingsSink = std::function<void(const std::vector<validation::ValidationFinding>&)>;

/**
 * @brief Validate, resolve the target and append.
 *
 * Validation is skipped entirely when disabled in @a req. For the local
 * target the exclude file is created from git's template first.
 * @a on_findings receives the findings as soon as validation is done, before
 * the target is resolved or touched.
 *
 * @throws IgnoreError for git, configuration, I/O and interrupt failures.
 */
RunReport run_request(const Request& req, git_context::GitContextResolver& resolver,
                      const git_context::ExcludesLookup& lookup,
                      const FindingsSink& on_findings = {});

/** @brief Print findings grouped by severity. */
void print_findings(const std::vector<validation::ValidationFinding>& findings, std::ostream& err);

/** @brief Print the "Added N patterns" summary for a finished request. */
void print_report(const RunReport& report, std::ostream& out);

/**
 * @brief Explain an interrupt that arrived after the request had finished.
 *
 * The append either completed or had nothing to write, so the run still
 * succeeds; this only tells the user what state the target is in.
 */
void print_interrupt_notice(const RunReport& report, std::ostream& err);

/**
 * @brief Execute a parsed invocation and map the outcome to an exit code.
 *
 * Results go to @a out, findings and errors to @a err.
 */
int run(const Options& opts, const RunEnvironment& env, std::ostream& out, std::ostream& err);

} // namespace cli
