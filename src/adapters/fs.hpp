#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dirshift::adapters::fs {

/// true only for an existing directory (symlinks to directories count).
[[nodiscard]] auto directory_exists(const std::filesystem::path& path) -> bool;

/// Final path segment with trailing separators ignored:
/// "/data/exp_01/" -> "exp_01". Returns "" for "/" or an empty path.
[[nodiscard]] auto basename(std::string_view path) -> std::string;

/// Directory that would hold `path`: "/a/b/c/" -> "/a/b".
[[nodiscard]] auto parent_directory(const std::filesystem::path& path) -> std::filesystem::path;

/// base + "/" + name, with trailing separators of base dropped.
[[nodiscard]] auto join_under(std::string_view base, std::string_view name) -> std::filesystem::path;

/// Drops trailing separators except for the root itself.
[[nodiscard]] auto strip_trailing_separators(std::string_view path) -> std::string_view;

/// Glob match (fnmatch) of a single path component against any pattern.
[[nodiscard]] auto matches_any(std::string_view name, const std::vector<std::string>& patterns) -> bool;

/// true when the two paths name the same tree or one lies inside the other,
/// after symlinks and trailing separators are resolved.
[[nodiscard]] auto trees_overlap(const std::filesystem::path& a, const std::filesystem::path& b) -> bool;

} // namespace dirshift::adapters::fs
