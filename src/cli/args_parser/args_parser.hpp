#pragma once

#include <string>
#include <vector>
#include <optional>
#include <expected>

#include "../../core/mode_controller/mode_controller.hpp"
#include "../../infra/error_handler/error.hpp"

namespace dirshift::args_parser {

inline constexpr const char* kDefaultConfigFile = "rsync_config.yaml";

struct CLIArgs
{
    core::OperationSet operations;                  // -t -v -c -b, -m LETTERS
    std::string config_file{kDefaultConfigFile};    // -f, --config
    bool checksum{false};                           // --checksum
    std::optional<std::string> rsync_binary;        // --rsync
    std::vector<std::string> exclude_patterns;      // --exclude (repeatable)
    std::optional<std::string> log_file;            // --log-file
    bool quiet{false};                              // -q, --quiet
    bool verbose{false};                            // --verbose
    bool version{false};                            // --version
    bool help{false};                               // -h, --help (text printed by parse_args)
};

/// Parses the command line. Unknown flags and unknown operation letters
/// are a UsageError whose message carries the usage text.
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> infra::Result<CLIArgs>;

} // namespace dirshift::args_parser
