#include "fs.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <system_error>

namespace dirshift::adapters::fs {

auto directory_exists(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

auto strip_trailing_separators(std::string_view path) -> std::string_view {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    return path;
}

auto basename(std::string_view path) -> std::string {
    path = strip_trailing_separators(path);
    if (path.empty() || path == "/") {
        return {};
    }
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(slash + 1));
}

auto parent_directory(const std::filesystem::path& path) -> std::filesystem::path {
    const auto text = path.string();
    return std::filesystem::path(std::string(strip_trailing_separators(text))).parent_path();
}

auto join_under(std::string_view base, std::string_view name) -> std::filesystem::path {
    base = strip_trailing_separators(base);
    if (base == "/") {
        return std::filesystem::path(std::string("/").append(name));
    }
    std::string joined(base);
    joined.push_back('/');
    joined.append(name);
    return std::filesystem::path(joined);
}

namespace {

auto resolved(const std::filesystem::path& path) -> std::filesystem::path {
    const std::filesystem::path trimmed(std::string(strip_trailing_separators(path.string())));
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(trimmed, ec);
    if (ec) {
        return std::filesystem::absolute(trimmed, ec).lexically_normal();
    }
    return canonical;
}

auto is_prefix(const std::filesystem::path& prefix, const std::filesystem::path& path) -> bool {
    return std::mismatch(prefix.begin(), prefix.end(), path.begin(), path.end()).first == prefix.end();
}

} // namespace

auto trees_overlap(const std::filesystem::path& a, const std::filesystem::path& b) -> bool {
    const auto ra = resolved(a);
    const auto rb = resolved(b);
    return is_prefix(ra, rb) || is_prefix(rb, ra);
}

auto matches_any(std::string_view name, const std::vector<std::string>& patterns) -> bool {
    const std::string subject(name);
    for (const auto& pattern : patterns) {
        if (::fnmatch(pattern.c_str(), subject.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace dirshift::adapters::fs
