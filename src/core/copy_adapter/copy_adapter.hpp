#pragma once

#include <functional>
#include <string>
#include <vector>

#include "../transfer_job.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace dirshift::core {

/// Copies one job through rsync.
///
/// The copy is additive: destination-only content is never removed, and
/// re-running after a partial failure only transfers what is still missing.
class CopyAdapter {
public:
    // argv -> exit status; fails only when the command could not start
    using CommandRunner = std::function<infra::Result<int>(const std::vector<std::string>&)>;

    explicit CopyAdapter(const infra::Settings& settings);
    CopyAdapter(const infra::Settings& settings, CommandRunner runner);

    /// SourceMissing when the source directory is absent, CopyFailed when the
    /// destination parent cannot be created or rsync exits nonzero.
    [[nodiscard]] auto copy(const TransferJob& job) const -> infra::VoidResult;

    [[nodiscard]] auto build_command(const TransferJob& job) const -> std::vector<std::string>;

private:
    std::string binary_;
    std::vector<std::string> extra_args_;
    std::vector<std::string> excludes_;
    CommandRunner runner_;
};

} // namespace dirshift::core
