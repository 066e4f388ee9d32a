#include <spdlog/spdlog.h>

#include "cli/app/app.hpp"
#include "infra/console/console.hpp"
#include "infra/interrupt.hpp"

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        dirshift::infra::install_signal_handler();

        dirshift::infra::console::StreamPrompter prompter;
        return dirshift::cli::run(argc, argv, prompter);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
