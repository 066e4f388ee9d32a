#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "../infra/error_handler/error.hpp"

namespace dirshift::extensions {

/// Compiles a two-column table into the declarative form:
///
///   source,destination
///   # comment
///   /data/a,/archive/a
///
/// becomes `transfers: [{source: /data/a, destination: /archive/a}]`.
/// The header is required; blank and '#' rows are skipped. A row with a
/// single field produces a pair without destination (the resolver drops it).
[[nodiscard]] auto build_document_from_csv(const std::filesystem::path& path)
    -> infra::Result<YAML::Node>;

[[nodiscard]] auto build_document_from_csv(std::istream& in, std::string_view origin)
    -> infra::Result<YAML::Node>;

// Splits one CSV record, honouring double quotes ("" is a literal quote).
[[nodiscard]] auto split_csv_row(std::string_view line) -> std::vector<std::string>;

} // namespace dirshift::extensions
