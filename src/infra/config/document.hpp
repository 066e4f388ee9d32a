#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

#include "../error_handler/error.hpp"

namespace dirshift::infra {

/// A parsed transfer document queried by key paths such as
/// "transfer_groups[1].sources[0]". Absent keys, out-of-range indices and
/// YAML nulls all read as absent.
class ConfigDocument {
public:
    explicit ConfigDocument(YAML::Node root, std::filesystem::path origin = {});

    [[nodiscard]] auto query(std::string_view key_path) const -> std::optional<YAML::Node>;

    // Scalars only; a map or sequence where a scalar is expected reads as absent.
    [[nodiscard]] auto query_string(std::string_view key_path) const -> std::optional<std::string>;

    // Element count of a sequence, 0 when absent or not a sequence.
    [[nodiscard]] auto length(std::string_view key_path) const -> std::size_t;

    [[nodiscard]] auto origin() const -> const std::filesystem::path& { return origin_; }
    [[nodiscard]] auto root() const -> const YAML::Node& { return root_; }

private:
    YAML::Node root_;
    std::filesystem::path origin_;
};

/// Reads a transfer document. Files ending in ".csv" go through the CSV
/// builder first; everything else is parsed as YAML.
[[nodiscard]] auto load_transfer_document(const std::filesystem::path& path)
    -> Result<ConfigDocument>;

} // namespace dirshift::infra
