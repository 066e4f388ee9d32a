#pragma once

#include "../../core/copy_adapter/copy_adapter.hpp"
#include "../../infra/console/console.hpp"

namespace dirshift::cli {

/// Whole program run: parse, load, resolve, execute, summarize.
/// Returns the process exit status: 0 once jobs were resolved (even when some
/// fail), 1 for configuration errors, 2 for usage errors, 128 + signal when
/// interrupted. An empty runner means rsync through a child process.
[[nodiscard]] auto run(int argc, char const* const* argv,
                       infra::console::Prompter& prompter,
                       core::CopyAdapter::CommandRunner runner = {}) -> int;

} // namespace dirshift::cli
