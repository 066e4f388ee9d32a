#include "app.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../args_parser/args_parser.hpp"
#include "../../core/job_resolver/job_resolver.hpp"
#include "../../core/mode_controller/mode_controller.hpp"
#include "../../core/run_coordinator/run_coordinator.hpp"
#include "../../core/verify_engine/verify_engine.hpp"
#include "../../extensions/collision.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/config/document.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/logging/logging.hpp"
#include <git_info.hpp>

namespace dirshift::cli {

namespace {

using GIT = build_info::GitInfo;
using infra::console::Tone;
using infra::console::print_status;

constexpr auto git = build_info::get_git_info();

auto print_git_verse(const GIT& info) -> void {
    fmt::print("dirshift {}\n", build_info::version);
    fmt::print("Git branch: {}\n", info.branch);
    fmt::print("Git commit: {}\n", info.commit);
    fmt::print("Git dirty: {}\n", info.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", info.timestamp);
}

auto print_mappings(const std::vector<core::TransferJob>& jobs) -> void {
    print_status(Tone::Accent, "Transfer mappings:");
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        print_status(Tone::Accent, fmt::format("  {}. {}", i + 1, jobs[i].source.string()));
        print_status(Tone::Accent, fmt::format("      → {}", jobs[i].destination.string()));
    }
}

auto fail_with(infra::Error&& err) -> int {
    const auto code = err.to_exit_code();
    (void)infra::log_and_return(std::move(err));
    return code;
}

} // namespace

auto run(int argc, char const* const* argv,
         infra::console::Prompter& prompter,
         core::CopyAdapter::CommandRunner runner) -> int
{
    auto args_res = args_parser::parse_args(argc, argv);
    if (!args_res) {
        return fail_with(std::move(args_res.error()));
    }
    const auto& args = *args_res;
    if (args.help) {
        return 0;
    }
    if (args.version) {
        print_git_verse(git);
        return 0;
    }

    // 1. Settings file, then CLI on top
    auto settings_res = infra::load_settings_from_file();
    if (!settings_res) {
        return fail_with(infra::make_error(infra::ErrorCode::ConfigError, settings_res.error()));
    }
    auto settings = settings_res.value();
    settings.merge_with(infra::settings_from_cli(args));

    // Console only until the transfer file is known to be usable
    auto console_settings = settings;
    console_settings.log_file.reset();
    if (auto logging = infra::configure_logging(console_settings); !logging) {
        return fail_with(std::move(logging.error()));
    }
    infra::console::set_quiet(settings.quiet);

    // 2. Plan
    const auto mode = core::ModeController::resolve(args.operations);
    spdlog::debug("Plan: copy={} verify={} cleanup={}", mode.plan.do_copy,
                  mode.plan.do_verify, mode.plan.do_cleanup_prompt);

    print_status(Tone::Info, "=== Data Transfer ===");
    if (!settings.quiet) {
        spdlog::info("dirshift {} ({})", build_info::version, git.commit_short);
    }

    // 3. Jobs
    print_status(Tone::Info, fmt::format("Loading configuration from {}...", args.config_file));
    auto document = infra::load_transfer_document(args.config_file);
    if (!document) {
        return fail_with(std::move(document.error()));
    }

    core::JobResolver resolver(*document);
    auto jobs = resolver.resolve();
    if (!jobs) {
        return fail_with(std::move(jobs.error()));
    }

    if (settings.log_file) {
        if (auto logging = infra::configure_logging(settings); !logging) {
            return fail_with(std::move(logging.error()));
        }
    }

    print_status(Tone::Success, fmt::format("✓ Loaded {} transfer mappings", jobs->size()));
    print_status(Tone::Info, fmt::format("Mode: {}", mode.label));
    print_status(Tone::Info, fmt::format("Transfers to process: {}", jobs->size()));
    fmt::print("\n");
    print_mappings(*jobs);

    if (mode.plan.do_copy) {
        extensions::report_collisions(extensions::find_collisions(*jobs, settings.effective_excludes()));
    }

    // 4. Run
    const auto copier = runner ? core::CopyAdapter(settings, std::move(runner))
                               : core::CopyAdapter(settings);
    core::VerifyEngine verifier(settings);
    core::RunCoordinator coordinator(mode.plan, copier, verifier, prompter);

    fmt::print("\n");
    print_status(Tone::Warning, fmt::format("=== {} Mode ===", mode.label));
    const auto report = coordinator.run(*jobs);

    if (mode.plan.do_copy && !mode.plan.do_verify) {
        fmt::print("\n");
        print_status(Tone::Warning, "Note: Run with -v option to validate the transfers");
    }

    fmt::print("\n");
    if (report.interrupted) {
        print_status(Tone::Warning, "=== Interrupted ===");
        return infra::interrupt_exit_code();
    }
    print_status(Tone::Info, "=== Completed ===");

    // Job failures are in the summary, not in the exit status
    return 0;
}

} // namespace dirshift::cli
