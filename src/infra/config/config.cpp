#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdlib>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace dirshift::infra {

    void Settings::merge_with(const Settings& other) {
        if (other.rsync_binary) rsync_binary = other.rsync_binary;
        if (!other.rsync_args.empty()) rsync_args = other.rsync_args;
        if (!other.exclude_patterns.empty()) {
            exclude_patterns.insert(exclude_patterns.end(),
                                    other.exclude_patterns.begin(),
                                    other.exclude_patterns.end());
        }
        if (other.checksum) checksum = true;
        if (other.quiet) quiet = true;
        if (other.verbose) verbose = true;
        if (other.log_file) log_file = other.log_file;
    }

    auto Settings::effective_excludes() const -> std::vector<std::string> {
        std::vector<std::string> patterns = default_excludes();
        for (const auto& pat : exclude_patterns) {
            if (std::find(patterns.begin(), patterns.end(), pat) == patterns.end()) {
                patterns.push_back(pat);
            }
        }
        return patterns;
    }

    auto default_excludes() -> const std::vector<std::string>& {
        static const std::vector<std::string> patterns{
            ".DS_Store",
            "._*",
            ".Spotlight-V100",
            ".Trashes",
            ".fseventsd",
            ".TemporaryItems",
            ".DocumentRevisions-V100",
            "Thumbs.db",
            "desktop.ini",
        };
        return patterns;
    }

    static auto get_settings_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        paths.push_back(".dirshift.yaml");

        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "dirshift" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "dirshift" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_settings_from(const std::vector<std::filesystem::path>& candidates)
        -> std::expected<Settings, std::string>
    {
        for (const auto& path : candidates) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;

            try {
                YAML::Node node = YAML::LoadFile(path.string());
                Settings settings{};

                if (node["rsync_binary"]) settings.rsync_binary = node["rsync_binary"].as<std::string>();
                if (node["rsync_args"]) {
                    for (const auto& arg : node["rsync_args"]) {
                        settings.rsync_args.push_back(arg.as<std::string>());
                    }
                }
                if (node["exclude"]) {
                    for (const auto& pat : node["exclude"]) {
                        settings.exclude_patterns.push_back(pat.as<std::string>());
                    }
                }
                if (node["checksum"]) settings.checksum = node["checksum"].as<bool>();
                if (node["quiet"]) settings.quiet = node["quiet"].as<bool>();
                if (node["verbose"]) settings.verbose = node["verbose"].as<bool>();
                if (node["log_file"]) settings.log_file = node["log_file"].as<std::string>();

                spdlog::debug("Loaded settings from {}", path.string());
                return settings;

            } catch (const YAML::Exception& e) {
                return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
            }
        }

        // No settings file is fine
        return Settings{};
    }

    auto load_settings_from_file() -> std::expected<Settings, std::string> {
        return load_settings_from(get_settings_paths());
    }

    auto settings_from_cli(const args_parser::CLIArgs& args) -> Settings {
        Settings settings{};
        settings.rsync_binary = args.rsync_binary;
        settings.exclude_patterns = args.exclude_patterns;
        settings.checksum = args.checksum;
        settings.quiet = args.quiet;
        settings.verbose = args.verbose;
        settings.log_file = args.log_file;
        return settings;
    }

} // namespace dirshift::infra
