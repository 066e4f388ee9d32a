#pragma once

#include <iostream>
#include <istream>
#include <ostream>
#include <string_view>

namespace dirshift::infra::console {

enum class Tone {
    Error,
    Success,
    Warning,
    Info,
    Accent,
};

// Colors are used only when stdout is a terminal
void print_status(Tone tone, std::string_view message);

// Quiet mode drops Info and Accent lines
void set_quiet(bool quiet);

/// Yes/no confirmation. Implementations may block indefinitely.
class Prompter {
public:
    virtual ~Prompter() = default;

    [[nodiscard]] virtual auto confirm(std::string_view question) -> bool = 0;
};

/// Asks "<question> (y/N): " and accepts an answer starting with y or Y.
/// End of input counts as no.
class StreamPrompter final : public Prompter {
public:
    explicit StreamPrompter(std::istream& in = std::cin, std::ostream& out = std::cout);

    [[nodiscard]] auto confirm(std::string_view question) -> bool override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace dirshift::infra::console
