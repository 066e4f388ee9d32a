#include "copy_adapter.hpp"

#include <algorithm>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../../adapters/fs.hpp"
#include "../../adapters/process.hpp"

namespace dirshift::core {

namespace {

// Options that would make rsync remove files
auto is_destructive(const std::string& arg) -> bool {
    return arg.starts_with("--delete") ||
           arg.starts_with("--remove-source-files") ||
           arg == "--del";
}

auto with_trailing_separator(const std::filesystem::path& path) -> std::string {
    std::string text(adapters::fs::strip_trailing_separators(path.string()));
    if (text.empty() || text.back() != '/') {
        text.push_back('/');
    }
    return text;
}

} // namespace

CopyAdapter::CopyAdapter(const infra::Settings& settings)
    : CopyAdapter(settings, adapters::process::run_command) {}

CopyAdapter::CopyAdapter(const infra::Settings& settings, CommandRunner runner)
    : binary_(settings.rsync())
    , excludes_(settings.effective_excludes())
    , runner_(std::move(runner))
{
    for (const auto& arg : settings.rsync_args) {
        if (is_destructive(arg)) {
            spdlog::warn("Ignoring rsync option '{}': transfers never delete at the destination", arg);
            continue;
        }
        extra_args_.push_back(arg);
    }
}

auto CopyAdapter::build_command(const TransferJob& job) const -> std::vector<std::string> {
    std::vector<std::string> argv{binary_, "-a", "--partial", "--progress"};
    for (const auto& pattern : excludes_) {
        argv.push_back(fmt::format("--exclude={}", pattern));
    }
    argv.insert(argv.end(), extra_args_.begin(), extra_args_.end());
    // Trailing slashes copy the contents of source into destination
    argv.push_back(with_trailing_separator(job.source));
    argv.push_back(with_trailing_separator(job.destination));
    return argv;
}

auto CopyAdapter::copy(const TransferJob& job) const -> infra::VoidResult {
    if (!adapters::fs::directory_exists(job.source)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceMissing,
            fmt::format("Source directory {} does not exist", job.source.string())));
    }

    const auto parent = adapters::fs::parent_directory(job.destination);
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailed,
                fmt::format("Cannot create {}: {}", parent.string(), ec.message())));
        }
    }

    auto status = runner_(build_command(job));
    if (!status) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailed, status.error().message));
    }
    if (*status != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailed,
            fmt::format("{} exited with status {}", binary_, *status)));
    }
    return {};
}

} // namespace dirshift::core
