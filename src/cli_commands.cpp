#include <filesystem>
#include <ostream>
#include <string>

#include "cli_commands.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;
using git_context::TargetKind;
using validation::Severity;

namespace cli {

Request make_request(const Options& opts) {
    Request req;
    req.patterns = opts.patterns;
    req.target = opts.target;
    req.validate = opts.validate;
    req.allow_duplicates = opts.allow_duplicates;
    req.policy = opts.policy;
    return req;
}

RunReport run_request(const Request& req, git_context::GitContextResolver& resolver,
                      const git_context::ExcludesLookup& lookup,
                      const FindingsSink& on_findings) {
    RunReport report;
    report.target_kind = req.target;
    if (req.validate) {
        report.findings = validation::validate_patterns(req.patterns, req.policy);
        if (on_findings)
            on_findings(report.findings);
        if (validation::has_blocking_findings(report.findings)) {
            log_warning("Validation blocked request",
                        {{"patterns", std::to_string(req.patterns.size())}});
            report.blocked = true;
            return report;
        }
    }

    report.target_path = git_context::resolve_target_path(req.target, resolver, lookup);
    log_debug("Target resolved", {{"path", report.target_path.string()}});

    bool created_template = false;
    if (req.target == TargetKind::Local)
        created_template = ignore::ensure_exclude_file(report.target_path);

    report.append = ignore::append_patterns(report.target_path, req.patterns, req.allow_duplicates);
    report.append.created = report.append.created || created_template;
    return report;
}

void print_findings(const std::vector<validation::ValidationFinding>& findings,
                    std::ostream& err) {
    bool header = false;
    for (const auto& f : findings) {
        if (f.severity != Severity::Error)
            continue;
        if (!header) {
            err << "ERROR: Found problematic patterns:\n";
            header = true;
        }
        err << "  " << f.pattern << ": " << f.message << "\n";
    }
    header = false;
    for (const auto& f : findings) {
        if (f.severity != Severity::Warning)
            continue;
        if (!header) {
            err << "WARNING: Potentially problematic patterns:\n";
            header = true;
        }
        err << "  " << f.pattern << ": " << f.message << "\n";
    }
    for (const auto& f : findings) {
        if (f.severity == Severity::Info)
            err << "INFO: " << f.pattern << ": " << f.message << "\n";
    }
}

namespace {

std::string count_noun(std::size_t n, const char* singular, const char* plural) {
    return std::to_string(n) + " " + (n == 1 ? singular : plural);
}

} // namespace

void print_report(const RunReport& report, std::ostream& out) {
    const std::string desc = git_context::target_description(report.target_kind, report.target_path);
    const auto& added = report.append.added;
    const auto& skipped = report.append.skipped_duplicates;
    const std::size_t blank = report.append.dropped_blank;
    if (added.empty()) {
        out << "No new patterns added to " << desc;
        if (!skipped.empty() && blank == 0)
            out << " (all patterns already exist)";
        else if (skipped.empty() && blank > 0)
            out << " (" << count_noun(blank, "blank pattern", "blank patterns") << " ignored)";
        else if (!skipped.empty())
            out << " (" << skipped.size() << " already exist, " << blank << " blank ignored)";
        out << "\n";
    } else {
        out << "Added " << count_noun(added.size(), "pattern", "patterns") << " to " << desc
            << ":\n";
        for (const auto& p : added)
            out << "  " << p << "\n";
        if (blank > 0)
            out << "Ignored " << count_noun(blank, "blank pattern", "blank patterns") << "\n";
    }
    if (!skipped.empty()) {
        out << "Skipped " << skipped.size() << " existing:\n";
        for (const auto& p : skipped)
            out << "  " << p << "\n";
    }
}

void print_interrupt_notice(const RunReport& report, std::ostream& err) {
    const std::string desc = git_context::target_description(report.target_kind, report.target_path);
    if (report.append.added.empty() && !report.append.created)
        err << "Interrupt received; " << desc << " was left unchanged\n";
    else
        err << "Interrupt received after " << desc << " was updated; the change was kept\n";
}

int run(const Options& opts, const RunEnvironment& env, std::ostream& out, std::ostream& err) {
    git_context::GitContextResolver resolver(env.start_dir);
    try {
        RunReport report =
            run_request(make_request(opts), resolver, env.lookup,
                        [&err](const std::vector<validation::ValidationFinding>& findings) {
                            print_findings(findings, err);
                        });
        if (report.blocked)
            return exit_code_for(ErrorKind::Validation);
        print_report(report, out);
        if (procutil::interrupt_requested()) {
            log_warning("Interrupt received after the request completed",
                        {{"target", report.target_path.string()}});
            print_interrupt_notice(report, err);
        }
        return EXIT_OK;
    } catch (const IgnoreError& e) {
        log_error(error_kind_label(e.kind()), {{"error", e.what()}, {"path", e.path().string()}});
        err << error_kind_label(e.kind()) << ": " << e.what() << "\n";
        if (e.kind() == ErrorKind::Configuration)
            err << "Try 'git config --global core.excludesFile ~/.gitignore_global' to set a "
                   "global gitignore\n";
        return exit_code_for(e.kind());
    }
}

} // namespace cli
