#pragma once

#include <filesystem>
#include <string>
#include <fmt/core.h>

namespace dirshift::core {

struct TransferJob {
    std::filesystem::path source;
    std::filesystem::path destination;

    bool operator==(const TransferJob&) const = default;

    [[nodiscard]] auto describe() const -> std::string {
        return fmt::format("{} → {}", source.string(), destination.string());
    }
};

} // namespace dirshift::core
