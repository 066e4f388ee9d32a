#include "run_coordinator.hpp"

#include <algorithm>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../../adapters/fs.hpp"
#include "../../infra/interrupt.hpp"

namespace dirshift::core {

using infra::console::Tone;
using infra::console::print_status;

auto to_string(PhaseResult result) -> std::string_view {
    switch (result) {
        case PhaseResult::Success: return "success";
        case PhaseResult::Failed:  return "failed";
        case PhaseResult::Skipped: return "skipped";
    }
    return "unknown";
}

auto JobOutcome::failure_annotation() const -> std::string_view {
    if (copy_result == PhaseResult::Failed) return "transfer failed";
    if (verify_result == PhaseResult::Failed) return "validation failed";
    return {};
}

auto RunReport::succeeded() const -> std::vector<const JobOutcome*> {
    std::vector<const JobOutcome*> out;
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) out.push_back(&outcome);
    }
    return out;
}

auto RunReport::failed() const -> std::vector<const JobOutcome*> {
    std::vector<const JobOutcome*> out;
    for (const auto& outcome : outcomes) {
        if (!outcome.succeeded()) out.push_back(&outcome);
    }
    return out;
}

RunCoordinator::RunCoordinator(const ExecutionPlan& plan,
                               const CopyAdapter& copier,
                               const VerifyEngine& verifier,
                               infra::console::Prompter& prompter)
    : plan_(plan), copier_(copier), verifier_(verifier), prompter_(prompter) {}

auto RunCoordinator::run(const std::vector<TransferJob>& jobs) -> RunReport {
    RunReport report;
    report.outcomes.reserve(jobs.size());

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        if (infra::is_interrupted()) {
            spdlog::warn("Interrupted: {} of {} jobs not started", jobs.size() - i, jobs.size());
            report.interrupted = true;
            break;
        }
        fmt::print("\n");
        print_status(Tone::Warning, fmt::format("=== Transfer {} of {} ===", i + 1, jobs.size()));
        report.outcomes.push_back(process_job(jobs[i]));
    }

    print_summary(report);

    if (report.interrupted || infra::is_interrupted()) {
        report.interrupted = true;
        if (plan_.do_cleanup_prompt) {
            print_status(Tone::Warning, "Cleanup skipped: run was interrupted");
        }
        return report;
    }

    if (plan_.do_cleanup_prompt) {
        report.cleanup = run_cleanup(report.outcomes);
    }
    return report;
}

auto RunCoordinator::process_job(const TransferJob& job) const -> JobOutcome {
    JobOutcome outcome{.job = job};

    if (plan_.do_copy) {
        print_status(Tone::Accent, fmt::format("→ Transferring: {}", adapters::fs::basename(job.source.string())));
        print_status(Tone::Info, fmt::format("  From: {}", job.source.string()));
        print_status(Tone::Info, fmt::format("  To: {}", job.destination.string()));

        auto copied = copier_.copy(job);
        if (!copied) {
            const auto& err = copied.error();
            outcome.copy_result = PhaseResult::Failed;
            outcome.failure = err.code;
            outcome.reason = fmt::format("{}: {}", infra::to_string(err.code), err.message);
            print_status(Tone::Error, fmt::format("✗ Transfer failed ({})", outcome.reason));
            spdlog::debug("copy of {} failed at {}:{}", job.source.string(), err.file, err.line);
            return outcome;
        }
        outcome.copy_result = PhaseResult::Success;
        print_status(Tone::Success, "✓ Transfer completed");
    }

    if (plan_.do_verify) {
        verify_phase(outcome);
    }
    spdlog::debug("{}: copy {}, verify {}", job.describe(),
                  to_string(outcome.copy_result), to_string(outcome.verify_result));
    return outcome;
}

auto RunCoordinator::verify_phase(JobOutcome& outcome) const -> void {
    print_status(Tone::Info, "Verifying transfer integrity...");
    const auto report = verifier_.verify(outcome.job.source, outcome.job.destination);

    if (report.passed) {
        outcome.verify_result = PhaseResult::Success;
        print_status(Tone::Success, fmt::format("✓ Verification passed ({} files, {} bytes)",
                                                report.files_checked, report.bytes_checked));
        return;
    }

    outcome.verify_result = PhaseResult::Failed;
    const bool missing_dir = report.failure == VerifyFailure::SourceMissing ||
                             report.failure == VerifyFailure::DestinationMissing;
    outcome.failure = missing_dir ? infra::ErrorCode::DirectoryMissing : infra::ErrorCode::VerifyFailed;
    outcome.reason = report.reason;

    print_status(Tone::Error, fmt::format("✗ Verification failed: {}", report.reason));
    for (const auto& discrepancy : report.discrepancies) {
        print_status(Tone::Error, fmt::format("    - {}", discrepancy.describe()));
    }
    if (report.truncated) {
        print_status(Tone::Error, fmt::format("    ... and {} more",
                                              report.total_discrepancies - report.discrepancies.size()));
    }
}

void RunCoordinator::print_summary(const RunReport& report) const {
    const auto succeeded = report.succeeded();
    const auto failed = report.failed();

    fmt::print("\n");
    print_status(Tone::Info, "=== Summary ===");
    if (!succeeded.empty()) {
        print_status(Tone::Success, fmt::format("Successful: {}", succeeded.size()));
        for (const auto* outcome : succeeded) {
            print_status(Tone::Success, fmt::format("  ✓ {}", outcome->job.describe()));
        }
    }
    if (!failed.empty()) {
        print_status(Tone::Error, fmt::format("Failed: {}", failed.size()));
        for (const auto* outcome : failed) {
            print_status(Tone::Error, fmt::format("  ✗ {} ({})", outcome->job.describe(),
                                                  outcome->failure_annotation()));
            print_status(Tone::Error, fmt::format("      {}", outcome->reason));
        }
    }
    spdlog::info("{} succeeded, {} failed", succeeded.size(), failed.size());
}

auto RunCoordinator::run_cleanup(const std::vector<JobOutcome>& outcomes) -> CleanupReport {
    CleanupReport cleanup;

    std::vector<const JobOutcome*> candidates;
    for (const auto& outcome : outcomes) {
        if (outcome.is_cleanup_candidate()) candidates.push_back(&outcome);
    }
    if (candidates.empty()) {
        return cleanup;
    }

    fmt::print("\n");
    print_status(Tone::Warning, "=== Cleanup Phase ===");
    cleanup.offered = true;

    if (!prompter_.confirm("Do you want to delete successfully transferred source directories?")) {
        print_status(Tone::Warning, "Cleanup skipped by user");
        spdlog::info("Cleanup declined");
        return cleanup;
    }
    cleanup.consented = true;

    for (const auto* candidate : candidates) {
        if (infra::is_interrupted()) {
            spdlog::warn("Interrupted: cleanup stopped");
            break;
        }

        const auto& source = candidate->job.source;
        if (std::find(cleanup.deleted.begin(), cleanup.deleted.end(), source) != cleanup.deleted.end()) {
            spdlog::debug("{} already deleted", source.string());
            continue;
        }

        // A passing check proves nothing when both sides are the same tree
        if (adapters::fs::trees_overlap(source, candidate->job.destination)) {
            cleanup.overlapping.push_back(source);
            spdlog::warn("Not deleting {}: it overlaps its destination {}", source.string(),
                         candidate->job.destination.string());
            print_status(Tone::Error, fmt::format("✗ Keeping {}: source and destination overlap", source.string()));
            continue;
        }

        print_status(Tone::Warning, fmt::format("Preparing to delete source directory: {}", source.string()));

        // Fresh check: the tree may have changed since the first pass
        const auto recheck = verifier_.verify(source, candidate->job.destination);
        if (!recheck.passed) {
            cleanup.reverify_failed.push_back(source);
            print_status(Tone::Error, fmt::format("✗ Re-verification failed, keeping {}: {}",
                                                  source.string(), recheck.reason));
            continue;
        }

        if (!prompter_.confirm(fmt::format("Delete {}?", source.string()))) {
            cleanup.declined.push_back(source);
            print_status(Tone::Warning, fmt::format("Skipped deletion of {}", source.string()));
            continue;
        }

        std::error_code ec;
        std::filesystem::remove_all(source, ec);
        if (ec) {
            cleanup.delete_failed.push_back(source);
            print_status(Tone::Error, fmt::format("✗ Failed to delete {}: {}", source.string(), ec.message()));
            continue;
        }
        cleanup.deleted.push_back(source);
        print_status(Tone::Success, fmt::format("✓ Deleted {}", source.string()));
        spdlog::info("Deleted {}", source.string());
    }

    return cleanup;
}

} // namespace dirshift::core
