#include "collision.hpp"

#include <algorithm>
#include <map>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../adapters/fs.hpp"
#include "../core/verify_engine/verify_engine.hpp"

namespace dirshift::extensions {

namespace {

auto destination_key(const std::filesystem::path& destination) -> std::string {
    const auto normal = destination.lexically_normal().string();
    return std::string(adapters::fs::strip_trailing_separators(normal));
}

} // namespace

auto find_collisions(const std::vector<core::TransferJob>& jobs,
                     const std::vector<std::string>& excludes)
    -> std::vector<Collision>
{
    // destination -> distinct sources in job order
    std::map<std::string, std::vector<std::filesystem::path>> by_destination;
    for (const auto& job : jobs) {
        auto& sources = by_destination[destination_key(job.destination)];
        if (std::find(sources.begin(), sources.end(), job.source) == sources.end()) {
            sources.push_back(job.source);
        }
    }

    std::vector<Collision> collisions;
    for (const auto& [destination, sources] : by_destination) {
        if (sources.size() < 2) continue;

        std::map<std::filesystem::path, std::vector<std::pair<std::filesystem::path, std::uintmax_t>>> seen;
        for (const auto& source : sources) {
            auto manifest = core::scan_tree(source, excludes);
            if (!manifest) {
                spdlog::debug("Collision scan skips {}: {}", source.string(), manifest.error().message);
                continue;
            }
            for (const auto& [relative, size] : *manifest) {
                seen[relative].emplace_back(source, size);
            }
        }

        for (auto& [relative, contributors] : seen) {
            if (contributors.size() < 2) continue;
            const auto first_size = contributors.front().second;
            const bool differs = std::any_of(contributors.begin(), contributors.end(),
                [first_size](const auto& c) { return c.second != first_size; });
            if (differs) {
                collisions.push_back(Collision{destination, relative, std::move(contributors)});
            }
        }
    }
    return collisions;
}

void report_collisions(const std::vector<Collision>& collisions) {
    if (collisions.empty()) return;

    spdlog::warn("{} file(s) are written by more than one source with different sizes; "
                 "the last job in order wins", collisions.size());
    std::size_t shown = 0;
    for (const auto& collision : collisions) {
        if (shown++ == kMaxReportedCollisions) {
            spdlog::warn("  ... and {} more", collisions.size() - kMaxReportedCollisions);
            break;
        }
        std::string from;
        for (const auto& [source, size] : collision.contributors) {
            if (!from.empty()) from += ", ";
            from += fmt::format("{} ({} bytes)", source.string(), size);
        }
        spdlog::warn("  {}/{} <- {}", collision.destination.string(), collision.relative.string(), from);
    }
}

} // namespace dirshift::extensions
