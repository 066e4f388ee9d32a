#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace dirshift::core {

inline constexpr std::size_t kMaxReportedDiscrepancies = 20;

// Relative path -> size of every regular file under a root
using FileManifest = std::map<std::filesystem::path, std::uintmax_t>;

/// Walks `root` recursively. Entries whose name matches an exclude pattern
/// are skipped (directories with their whole subtree). Symlinks are not
/// followed and not recorded.
[[nodiscard]] auto scan_tree(const std::filesystem::path& root,
                             const std::vector<std::string>& excludes)
    -> infra::Result<FileManifest>;

enum class DiscrepancyKind {
    Missing,
    SizeMismatch,
    ContentMismatch,
};

struct Discrepancy {
    std::filesystem::path relative;
    DiscrepancyKind kind;
    std::uintmax_t source_size = 0;
    std::optional<std::uintmax_t> destination_size;

    [[nodiscard]] auto describe() const -> std::string;
};

enum class VerifyFailure {
    None,
    SourceMissing,
    DestinationMissing,
    ScanError,
    Mismatch,
};

struct VerifyReport {
    bool passed = false;
    VerifyFailure failure = VerifyFailure::None;
    std::string reason;

    // Sorted by relative path, at most kMaxReportedDiscrepancies entries
    std::vector<Discrepancy> discrepancies;
    std::size_t total_discrepancies = 0;
    bool truncated = false;

    std::size_t files_checked = 0;
    std::uintmax_t bytes_checked = 0;
};

/// Decides whether a destination faithfully holds a source.
///
/// Every (relative path, size) pair of regular files under the source must
/// exist under the destination. Extra destination content is allowed.
/// With checksum enabled, size-matched pairs are also compared by xxHash64.
class VerifyEngine {
public:
    explicit VerifyEngine(const infra::Settings& settings);

    [[nodiscard]] auto verify(const std::filesystem::path& source,
                              const std::filesystem::path& destination) const -> VerifyReport;

    [[nodiscard]] auto excludes() const -> const std::vector<std::string>& { return excludes_; }

private:
    std::vector<std::string> excludes_;
    bool checksum_ = false;
};

} // namespace dirshift::core
