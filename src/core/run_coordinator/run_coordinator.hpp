#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../transfer_job.hpp"
#include "../mode_controller/mode_controller.hpp"
#include "../copy_adapter/copy_adapter.hpp"
#include "../verify_engine/verify_engine.hpp"
#include "../../infra/console/console.hpp"
#include "../../infra/error_handler/error.hpp"

namespace dirshift::core {

enum class PhaseResult {
    Success,
    Failed,
    Skipped,
};

[[nodiscard]] auto to_string(PhaseResult result) -> std::string_view;

struct JobOutcome {
    TransferJob job;
    PhaseResult copy_result = PhaseResult::Skipped;
    PhaseResult verify_result = PhaseResult::Skipped;
    std::optional<infra::ErrorCode> failure;
    std::string reason;

    [[nodiscard]] auto succeeded() const -> bool {
        return copy_result != PhaseResult::Failed && verify_result != PhaseResult::Failed;
    }
    [[nodiscard]] auto is_cleanup_candidate() const -> bool {
        return verify_result == PhaseResult::Success;
    }
    // "transfer failed", "validation failed" or empty for a success
    [[nodiscard]] auto failure_annotation() const -> std::string_view;
};

struct CleanupReport {
    bool offered = false;
    bool consented = false;
    std::vector<std::filesystem::path> deleted;
    std::vector<std::filesystem::path> declined;
    std::vector<std::filesystem::path> reverify_failed;
    std::vector<std::filesystem::path> overlapping;   // destination is, holds or sits in the source
    std::vector<std::filesystem::path> delete_failed;
};

struct RunReport {
    std::vector<JobOutcome> outcomes;
    CleanupReport cleanup;
    bool interrupted = false;

    [[nodiscard]] auto succeeded() const -> std::vector<const JobOutcome*>;
    [[nodiscard]] auto failed() const -> std::vector<const JobOutcome*>;
};

/// Drives jobs through the phases of an ExecutionPlan, one at a time.
///
/// A failing job never stops the batch. Cleanup needs a blanket consent,
/// then a fresh verification and an individual consent per source.
class RunCoordinator {
public:
    RunCoordinator(const ExecutionPlan& plan,
                   const CopyAdapter& copier,
                   const VerifyEngine& verifier,
                   infra::console::Prompter& prompter);

    [[nodiscard]] auto run(const std::vector<TransferJob>& jobs) -> RunReport;

    [[nodiscard]] auto process_job(const TransferJob& job) const -> JobOutcome;

    [[nodiscard]] auto run_cleanup(const std::vector<JobOutcome>& outcomes) -> CleanupReport;

    void print_summary(const RunReport& report) const;

private:
    auto verify_phase(JobOutcome& outcome) const -> void;

    ExecutionPlan plan_;
    const CopyAdapter& copier_;
    const VerifyEngine& verifier_;
    infra::console::Prompter& prompter_;
};

} // namespace dirshift::core
