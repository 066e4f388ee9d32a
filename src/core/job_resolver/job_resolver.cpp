#include "job_resolver.hpp"

#include <optional>
#include <string>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../../adapters/fs.hpp"

namespace dirshift::core {

namespace {

// Empty scalars count as absent, like YAML null
auto non_empty(std::optional<std::string> value) -> std::optional<std::string> {
    if (value && value->empty()) return std::nullopt;
    return value;
}

} // namespace

JobResolver::JobResolver(const infra::ConfigDocument& document)
    : document_(document) {}

auto JobResolver::resolve() -> infra::Result<std::vector<TransferJob>> {
    diagnostics_.clear();
    std::vector<TransferJob> jobs;

    resolve_pairs(jobs);

    const auto group_count = document_.length("transfer_groups");
    for (std::size_t g = 0; g < group_count; ++g) {
        resolve_group(g, jobs);
    }

    if (jobs.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
            fmt::format("No transfers defined in configuration file {}", document_.origin().string())));
    }

    spdlog::debug("Resolved {} transfer jobs", jobs.size());
    return jobs;
}

void JobResolver::resolve_pairs(std::vector<TransferJob>& jobs) const {
    const auto count = document_.length("transfers");
    for (std::size_t i = 0; i < count; ++i) {
        auto source = non_empty(document_.query_string(fmt::format("transfers[{}].source", i)));
        auto destination = non_empty(document_.query_string(fmt::format("transfers[{}].destination", i)));
        if (!source || !destination) {
            spdlog::debug("transfers[{}] is incomplete, skipped", i);
            continue;
        }
        jobs.push_back(TransferJob{*source, *destination});
    }
}

void JobResolver::resolve_group(std::size_t group, std::vector<TransferJob>& jobs) {
    const auto prefix = fmt::format("transfer_groups[{}]", group);

    auto base = non_empty(document_.query_string(prefix + ".destination_base"));
    if (!base) {
        diagnostics_.push_back(infra::log_and_return(infra::make_error(infra::ErrorCode::ConfigError,
            fmt::format("destination_base missing in group {}", group + 1))));
        return;
    }

    bool preserve_name = true;
    if (auto flag = document_.query(prefix + ".preserve_source_name")) {
        try {
            preserve_name = flag->as<bool>();
        } catch (const YAML::Exception&) {
            diagnostics_.push_back(infra::log_and_return(infra::make_error(infra::ErrorCode::ConfigError,
                fmt::format("preserve_source_name in group {} is not a boolean", group + 1))));
            return;
        }
    }

    const auto source_count = document_.length(prefix + ".sources");
    for (std::size_t s = 0; s < source_count; ++s) {
        auto source = non_empty(document_.query_string(fmt::format("{}.sources[{}]", prefix, s)));
        if (!source) continue;

        if (!preserve_name) {
            // Many-to-one merge: every source lands in the base itself
            jobs.push_back(TransferJob{*source, *base});
            continue;
        }

        const auto name = adapters::fs::basename(*source);
        if (name.empty()) {
            diagnostics_.push_back(infra::log_and_return(infra::make_error(infra::ErrorCode::ConfigError,
                fmt::format("Cannot derive a directory name from '{}' in group {}", *source, group + 1))));
            continue;
        }
        jobs.push_back(TransferJob{*source, adapters::fs::join_under(*base, name)});
    }
}

} // namespace dirshift::core
