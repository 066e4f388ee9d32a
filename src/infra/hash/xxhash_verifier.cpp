#include "xxhash_verifier.hpp"

#include <fstream>
#include <memory>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace dirshift::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

using StatePtr = std::unique_ptr<XXH64_state_t, StateDeleter>;

} // namespace

XXHashVerifier::XXHashVerifier() : buffer_(kBufferSize) {}

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::VerifyFailed,
            fmt::format("cannot open {} for hashing", path.string())));
    }

    StatePtr state{XXH64_createState()};
    if (!state || XXH64_reset(state.get(), 0) == XXH_ERROR) {
        return std::unexpected(make_error(ErrorCode::Unknown, "xxHash64 state allocation failed"));
    }

    while (file.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size())) || file.gcount() > 0) {
        const auto chunk = static_cast<std::size_t>(file.gcount());
        XXH64_update(state.get(), buffer_.data(), chunk);
        bytes_hashed_ += chunk;
    }
    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::VerifyFailed,
            fmt::format("read error while hashing {}", path.string())));
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::files_match(const std::filesystem::path& source,
                                 const std::filesystem::path& destination)
    -> std::expected<bool, Error>
{
    auto source_digest = hash_file(source);
    if (!source_digest) {
        return std::unexpected(std::move(source_digest.error()));
    }
    auto destination_digest = hash_file(destination);
    if (!destination_digest) {
        return std::unexpected(std::move(destination_digest.error()));
    }

    if (*source_digest != *destination_digest) {
        spdlog::debug("xxh64 {:016x} {} != {:016x} {}", *source_digest, source.string(),
                      *destination_digest, destination.string());
        return false;
    }
    return true;
}

} // namespace dirshift::infra
