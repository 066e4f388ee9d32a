#include "verify_engine.hpp"

#include <optional>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../../adapters/fs.hpp"
#include "../../infra/hash/xxhash_verifier.hpp"

namespace dirshift::core {

namespace {

auto failed(VerifyFailure failure, std::string reason) -> VerifyReport {
    VerifyReport report;
    report.passed = false;
    report.failure = failure;
    report.reason = std::move(reason);
    return report;
}

void record(VerifyReport& report, Discrepancy discrepancy) {
    ++report.total_discrepancies;
    if (report.discrepancies.size() < kMaxReportedDiscrepancies) {
        report.discrepancies.push_back(std::move(discrepancy));
    } else {
        report.truncated = true;
    }
}

} // namespace

auto scan_tree(const std::filesystem::path& root,
               const std::vector<std::string>& excludes)
    -> infra::Result<FileManifest>
{
    FileManifest manifest;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(root, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VerifyFailed,
            fmt::format("Cannot read {}: {}", root.string(), ec.message())));
    }

    for (; it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::VerifyFailed,
                fmt::format("Cannot walk {}: {}", root.string(), ec.message())));
        }

        const auto& entry = *it;
        if (adapters::fs::matches_any(entry.path().filename().string(), excludes)) {
            if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        const auto status = entry.symlink_status(ec);
        if (ec || status.type() != std::filesystem::file_type::regular) {
            continue;
        }

        const auto size = entry.file_size(ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::VerifyFailed,
                fmt::format("Cannot stat {}: {}", entry.path().string(), ec.message())));
        }
        manifest.emplace(entry.path().lexically_relative(root), size);
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VerifyFailed,
            fmt::format("Cannot walk {}: {}", root.string(), ec.message())));
    }

    return manifest;
}

auto Discrepancy::describe() const -> std::string {
    switch (kind) {
        case DiscrepancyKind::Missing:
            return fmt::format("{} (missing at destination)", relative.string());
        case DiscrepancyKind::SizeMismatch:
            return fmt::format("{} (size {} != {})", relative.string(), source_size,
                               destination_size.value_or(0));
        case DiscrepancyKind::ContentMismatch:
            return fmt::format("{} (content differs)", relative.string());
    }
    return relative.string();
}

VerifyEngine::VerifyEngine(const infra::Settings& settings)
    : excludes_(settings.effective_excludes())
    , checksum_(settings.checksum) {}

auto VerifyEngine::verify(const std::filesystem::path& source,
                          const std::filesystem::path& destination) const -> VerifyReport
{
    if (!adapters::fs::directory_exists(source)) {
        return failed(VerifyFailure::SourceMissing,
                      fmt::format("directory missing: source {} does not exist", source.string()));
    }
    if (!adapters::fs::directory_exists(destination)) {
        return failed(VerifyFailure::DestinationMissing,
                      fmt::format("directory missing: destination {} does not exist", destination.string()));
    }

    auto manifest = scan_tree(source, excludes_);
    if (!manifest) {
        return failed(VerifyFailure::ScanError, manifest.error().message);
    }

    std::optional<infra::XXHashVerifier> hasher;
    if (checksum_) hasher.emplace();

    VerifyReport report;
    for (const auto& [relative, size] : *manifest) {
        ++report.files_checked;
        report.bytes_checked += size;

        const auto counterpart = destination / relative;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(counterpart, ec)) {
            record(report, Discrepancy{relative, DiscrepancyKind::Missing, size, std::nullopt});
            continue;
        }

        const auto dest_size = std::filesystem::file_size(counterpart, ec);
        if (ec || dest_size != size) {
            record(report, Discrepancy{relative, DiscrepancyKind::SizeMismatch, size,
                                       ec ? std::nullopt : std::optional<std::uintmax_t>{dest_size}});
            continue;
        }

        if (hasher) {
            auto same = hasher->files_match(source / relative, counterpart);
            if (!same) {
                spdlog::warn("{}", same.error().message);
            }
            if (!same || !*same) {
                record(report, Discrepancy{relative, DiscrepancyKind::ContentMismatch, size, dest_size});
            }
        }
    }

    spdlog::debug("Checked {} files ({} bytes) of {}", report.files_checked,
                  report.bytes_checked, source.string());
    if (hasher) {
        spdlog::debug("Hashed {} bytes", hasher->bytes_hashed());
    }

    if (report.total_discrepancies == 0) {
        report.passed = true;
        return report;
    }

    report.failure = VerifyFailure::Mismatch;
    report.reason = fmt::format("{} of {} files missing or different at destination",
                                report.total_discrepancies, report.files_checked);
    return report;
}

} // namespace dirshift::core
