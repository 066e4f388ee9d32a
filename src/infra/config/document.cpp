#include "document.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include "../../extensions/csv_builder.hpp"

namespace dirshift::infra {

namespace {

struct PathStep {
    std::string key;                 // empty for a bare index step
    std::optional<std::size_t> index;
};

// "a[0].b" -> {a}, {[0]}, {b}
auto split_key_path(std::string_view key_path) -> std::optional<std::vector<PathStep>> {
    std::vector<PathStep> steps;
    std::size_t pos = 0;
    while (pos < key_path.size()) {
        if (key_path[pos] == '.') {
            ++pos;
            continue;
        }
        if (key_path[pos] == '[') {
            auto close = key_path.find(']', pos);
            if (close == std::string_view::npos) return std::nullopt;
            std::size_t idx = 0;
            auto digits = key_path.substr(pos + 1, close - pos - 1);
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), idx);
            if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty()) {
                return std::nullopt;
            }
            steps.push_back(PathStep{.key = {}, .index = idx});
            pos = close + 1;
            continue;
        }
        auto end = key_path.find_first_of(".[", pos);
        if (end == std::string_view::npos) end = key_path.size();
        steps.push_back(PathStep{.key = std::string(key_path.substr(pos, end - pos)), .index = std::nullopt});
        pos = end;
    }
    return steps;
}

auto has_extension(const std::filesystem::path& path, std::string_view ext) -> bool {
    auto actual = path.extension().string();
    std::transform(actual.begin(), actual.end(), actual.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return actual == ext;
}

} // namespace

ConfigDocument::ConfigDocument(YAML::Node root, std::filesystem::path origin)
    : root_(std::move(root)), origin_(std::move(origin)) {}

auto ConfigDocument::query(std::string_view key_path) const -> std::optional<YAML::Node> {
    auto steps = split_key_path(key_path);
    if (!steps) {
        spdlog::debug("Malformed key path '{}'", key_path);
        return std::nullopt;
    }

    // Node::operator= writes through to the tree, so walk with reset()
    YAML::Node current;
    current.reset(root_);
    for (const auto& step : *steps) {
        const YAML::Node& view = current;
        if (step.index) {
            if (!view.IsSequence() || *step.index >= view.size()) return std::nullopt;
        } else if (!view.IsMap()) {
            return std::nullopt;
        }
        // Copy-construct only: a missing key is an invalid node, and both
        // assignment and reset() throw on it
        const YAML::Node child = step.index ? view[*step.index] : view[step.key];
        if (!child.IsDefined() || child.IsNull()) return std::nullopt;
        current.reset(child);
    }
    return current;
}

auto ConfigDocument::query_string(std::string_view key_path) const -> std::optional<std::string> {
    auto node = query(key_path);
    if (!node || !node->IsScalar()) return std::nullopt;
    return node->as<std::string>();
}

auto ConfigDocument::length(std::string_view key_path) const -> std::size_t {
    auto node = query(key_path);
    if (!node || !node->IsSequence()) return 0;
    return node->size();
}

auto load_transfer_document(const std::filesystem::path& path) -> Result<ConfigDocument> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("Configuration file {} not found", path.string())));
    }

    if (has_extension(path, ".csv")) {
        auto built = extensions::build_document_from_csv(path);
        if (!built) {
            return std::unexpected(std::move(built.error()));
        }
        return ConfigDocument{std::move(*built), path};
    }

    try {
        return ConfigDocument{YAML::LoadFile(path.string()), path};
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::ConfigError,
            fmt::format("Failed to parse {}: {}", path.string(), e.what())));
    }
}

} // namespace dirshift::infra
