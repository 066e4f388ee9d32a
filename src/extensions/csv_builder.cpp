#include "csv_builder.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace dirshift::extensions {

namespace {

auto trim(std::string_view text) -> std::string {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

auto lowered(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

auto split_csv_row(std::string_view line) -> std::vector<std::string> {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(ch);
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    fields.push_back(trim(current));
    return fields;
}

auto build_document_from_csv(std::istream& in, std::string_view origin)
    -> infra::Result<YAML::Node>
{
    YAML::Node transfers(YAML::NodeType::Sequence);
    std::optional<std::size_t> source_col;
    std::optional<std::size_t> destination_col;
    std::size_t column_count = 0;

    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        const auto stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#') continue;

        auto fields = split_csv_row(stripped);

        if (!source_col) {
            column_count = fields.size();
            for (std::size_t i = 0; i < fields.size(); ++i) {
                const auto name = lowered(fields[i]);
                if (name == "source") source_col = i;
                else if (name == "destination") destination_col = i;
            }
            if (!source_col || !destination_col || column_count != 2) {
                return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                    fmt::format("{}:{}: header must name the columns 'source' and 'destination'",
                                origin, line_number)));
            }
            continue;
        }

        if (fields.size() > column_count) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                fmt::format("{}:{}: expected {} columns, found {}",
                            origin, line_number, column_count, fields.size())));
        }

        YAML::Node pair(YAML::NodeType::Map);
        if (*source_col < fields.size() && !fields[*source_col].empty()) {
            pair["source"] = fields[*source_col];
        }
        if (*destination_col < fields.size() && !fields[*destination_col].empty()) {
            pair["destination"] = fields[*destination_col];
        }
        transfers.push_back(pair);
    }

    if (!source_col) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
            fmt::format("{}: missing 'source,destination' header row", origin)));
    }

    spdlog::debug("Compiled {} rows from {}", transfers.size(), origin);

    YAML::Node document(YAML::NodeType::Map);
    document["transfers"] = transfers;
    return document;
}

auto build_document_from_csv(const std::filesystem::path& path)
    -> infra::Result<YAML::Node>
{
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
            fmt::format("Cannot open {}", path.string())));
    }
    return build_document_from_csv(file, path.string());
}

} // namespace dirshift::extensions
