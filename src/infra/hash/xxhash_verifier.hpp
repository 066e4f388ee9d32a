#pragma once

#include <cstdint>
#include <filesystem>
#include <expected>
#include <vector>
#include <xxhash.h>

#include "../error_handler/error.hpp"

namespace dirshift::infra {

/// Content comparison for the checksum mode of verification.
/// One instance serves a whole tree walk and reuses its read buffer.
class XXHashVerifier {
public:
    XXHashVerifier();

    // xxHash64, seed 0
    [[nodiscard]] auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

    [[nodiscard]] auto files_match(const std::filesystem::path& source,
                                   const std::filesystem::path& destination)
        -> std::expected<bool, Error>;

    [[nodiscard]] auto bytes_hashed() const -> std::uintmax_t { return bytes_hashed_; }

private:
    static constexpr std::size_t kBufferSize = 1024 * 1024;

    std::vector<char> buffer_;
    std::uintmax_t bytes_hashed_ = 0;
};

} // namespace dirshift::infra
