#include "console.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <string>
#include <unistd.h>
#include <fmt/color.h>
#include <fmt/core.h>

namespace dirshift::infra::console {

namespace {

std::atomic<bool> g_quiet{false};

auto color_for(Tone tone) -> fmt::terminal_color {
    switch (tone) {
        case Tone::Error:   return fmt::terminal_color::red;
        case Tone::Success: return fmt::terminal_color::green;
        case Tone::Warning: return fmt::terminal_color::bright_yellow;
        case Tone::Info:    return fmt::terminal_color::blue;
        case Tone::Accent:  return fmt::terminal_color::cyan;
    }
    return fmt::terminal_color::white;
}

} // namespace

void set_quiet(bool quiet) {
    g_quiet.store(quiet, std::memory_order_relaxed);
}

void print_status(Tone tone, std::string_view message) {
    if (g_quiet.load(std::memory_order_relaxed) && (tone == Tone::Info || tone == Tone::Accent)) {
        return;
    }

    static const bool colored = ::isatty(STDOUT_FILENO) == 1;
    if (colored) {
        fmt::print(fmt::fg(color_for(tone)), "{}\n", message);
    } else {
        fmt::print("{}\n", message);
    }
    std::fflush(stdout);
}

StreamPrompter::StreamPrompter(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

auto StreamPrompter::confirm(std::string_view question) -> bool {
    out_ << question << " (y/N): " << std::flush;

    std::string reply;
    if (!std::getline(in_, reply)) {
        out_ << '\n';
        return false;
    }

    for (unsigned char ch : reply) {
        if (std::isspace(ch)) continue;
        return ch == 'y' || ch == 'Y';
    }
    return false;
}

} // namespace dirshift::infra::console
