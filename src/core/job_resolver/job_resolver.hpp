#pragma once

#include <vector>
#include "../transfer_job.hpp"
#include "../../infra/config/document.hpp"
#include "../../infra/error_handler/error.hpp"

namespace dirshift::core {

/// Flattens a transfer document into jobs.
///
/// Order: every entry of `transfers` in document order, then every group of
/// `transfer_groups`, each expanded in source order. A pair missing a field
/// contributes nothing; a group without `destination_base` is recorded in
/// diagnostics() and skipped. An empty result is a ConfigError.
class JobResolver {
public:
    explicit JobResolver(const infra::ConfigDocument& document);

    [[nodiscard]] auto resolve() -> infra::Result<std::vector<TransferJob>>;

    // Non-fatal problems found by the last resolve()
    [[nodiscard]] auto diagnostics() const -> const std::vector<infra::Error>& { return diagnostics_; }

private:
    void resolve_pairs(std::vector<TransferJob>& jobs) const;
    void resolve_group(std::size_t group, std::vector<TransferJob>& jobs);

    const infra::ConfigDocument& document_;
    std::vector<infra::Error> diagnostics_;
};

} // namespace dirshift::core
