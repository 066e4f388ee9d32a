#include "error.hpp"
#include <fmt/core.h>

namespace dirshift::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::ConfigError:
        case ErrorCode::UsageError:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::ConfigError:  return 1;
        case ErrorCode::UsageError:   return 2;
        case ErrorCode::Interrupted:  return 130; // SIGINT
        default:                      return EXIT_FAILURE;
    }
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level, "{}: {}", to_string(err.code), err.message);
    spdlog::debug("  raised at {}:{} in {}", err.file, err.line, err.function);
    return std::move(err);
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigError:      return "configuration error";
        case ErrorCode::UsageError:       return "usage error";
        case ErrorCode::SourceMissing:    return "source missing";
        case ErrorCode::DirectoryMissing: return "directory missing";
        case ErrorCode::CopyFailed:       return "copy failed";
        case ErrorCode::VerifyFailed:     return "verification failed";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::Unknown:          break;
    }
    return "unknown error";
}

} // namespace dirshift::infra
