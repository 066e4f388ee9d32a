#pragma once

#include <string>
#include <vector>

#include "../infra/error_handler/error.hpp"

namespace dirshift::adapters::process {

/// Runs argv[0] (PATH lookup) with the caller's stdio, blocking until it exits.
/// Returns the exit status; a child killed by a signal reports 128 + signo.
/// Fails only when the process could not be started at all.
[[nodiscard]] auto run_command(const std::vector<std::string>& argv) -> infra::Result<int>;

/// Shell-style rendering for logs.
[[nodiscard]] auto format_command(const std::vector<std::string>& argv) -> std::string;

} // namespace dirshift::adapters::process
