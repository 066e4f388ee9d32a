#pragma once

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <filesystem>

namespace dirshift::args_parser {
    struct CLIArgs;
}

namespace dirshift::infra {

/// Tool-wide settings. They shape how jobs run and are independent of
/// which transfers a config document lists.
struct Settings {
    // Copy
    std::optional<std::string> rsync_binary;
    std::vector<std::string> rsync_args;

    // Shared by copy and verify, on top of default_excludes()
    std::vector<std::string> exclude_patterns;

    // Verify
    bool checksum = false;

    // Output
    bool quiet = false;
    bool verbose = false;
    std::optional<std::string> log_file;

    // Values set in `other` win (used for CLI over file)
    void merge_with(const Settings& other);

    [[nodiscard]] auto rsync() const -> std::string {
        return rsync_binary.value_or("rsync");
    }

    /// default_excludes() followed by the user patterns, without duplicates.
    [[nodiscard]] auto effective_excludes() const -> std::vector<std::string>;
};

/// OS bookkeeping artifacts that are never transferred nor compared.
[[nodiscard]] auto default_excludes() -> const std::vector<std::string>&;

/// Loads settings from the first existing file of:
///   1. ./.dirshift.yaml
///   2. $XDG_CONFIG_HOME/dirshift/config.yaml, else ~/.config/dirshift/config.yaml
/// A missing file yields default Settings.
[[nodiscard]] auto load_settings_from_file() -> std::expected<Settings, std::string>;

[[nodiscard]] auto load_settings_from(const std::vector<std::filesystem::path>& candidates)
    -> std::expected<Settings, std::string>;

[[nodiscard]] auto settings_from_cli(const struct dirshift::args_parser::CLIArgs& args) -> Settings;

} // namespace dirshift::infra
