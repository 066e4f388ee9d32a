#include "logging.hpp"

#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dirshift::infra {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";

} // namespace

auto configure_logging(const Settings& settings) -> VoidResult {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (settings.log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*settings.log_file));
        } catch (const spdlog::spdlog_ex& e) {
            return std::unexpected(make_error(ErrorCode::ConfigError,
                fmt::format("Cannot open log file {}: {}", *settings.log_file, e.what())));
        }
    }

    auto logger = std::make_shared<spdlog::logger>("dirshift", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);

    auto level = spdlog::level::info;
    if (settings.verbose) level = spdlog::level::debug;
    else if (settings.quiet) level = spdlog::level::warn;
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(std::move(logger));
    return {};
}

} // namespace dirshift::infra
