#pragma once

#include "../config/config.hpp"
#include "../error_handler/error.hpp"

namespace dirshift::infra {

/// Replaces the default spdlog logger: colored console sink, plus a file
/// sink when settings.log_file is set. Level is info, debug when verbose,
/// warn when quiet.
[[nodiscard]] auto configure_logging(const Settings& settings) -> VoidResult;

} // namespace dirshift::infra
