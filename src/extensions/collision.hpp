#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "../core/transfer_job.hpp"

namespace dirshift::extensions {

inline constexpr std::size_t kMaxReportedCollisions = 20;

/// One relative path that several sources would write, with different sizes,
/// into the same destination.
struct Collision {
    std::filesystem::path destination;
    std::filesystem::path relative;
    std::vector<std::pair<std::filesystem::path, std::uintmax_t>> contributors; // job order
};

/// Scans jobs that share a destination but have different sources.
/// Unreadable or missing sources are left out of the scan.
[[nodiscard]] auto find_collisions(const std::vector<core::TransferJob>& jobs,
                                   const std::vector<std::string>& excludes)
    -> std::vector<Collision>;

/// Logs each collision as a warning. The copy still proceeds; the last job
/// in order wins.
void report_collisions(const std::vector<Collision>& collisions);

} // namespace dirshift::extensions
