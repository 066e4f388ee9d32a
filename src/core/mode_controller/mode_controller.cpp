#include "mode_controller.hpp"

#include <array>
#include <fmt/core.h>

namespace dirshift::core {

namespace {

constexpr unsigned T = static_cast<unsigned>(Operation::Transfer);
constexpr unsigned V = static_cast<unsigned>(Operation::Validate);
constexpr unsigned C = static_cast<unsigned>(Operation::Cleanup);

struct Rule {
    unsigned required;
    unsigned forbidden;
    ExecutionPlan plan;
    std::string_view label;
};

// First match wins
constexpr std::array<Rule, 6> kRules{{
    {T | C, 0,         {true,  true,  true},  "Transfer, Validate and Cleanup"},
    {C,     T,         {false, true,  true},  "Validate and Cleanup"},
    {T | V, C,         {true,  true,  false}, "Transfer and Validate"},
    {T,     V | C,     {true,  false, false}, "Transfer Only"},
    {V,     T | C,     {false, true,  false}, "Validate Only"},
    {0,     T | V | C, {true,  true,  true},  "Transfer, Validate and Cleanup"},
}};

} // namespace

auto parse_operation_letters(std::string_view token) -> infra::Result<OperationSet> {
    OperationSet ops;
    for (char letter : token) {
        switch (letter) {
            case 't': ops.add(Operation::Transfer); break;
            case 'v': ops.add(Operation::Validate); break;
            case 'c': ops.add(Operation::Cleanup); break;
            case 'b': ops.add(Operation::Transfer).add(Operation::Validate); break;
            default:
                return std::unexpected(infra::make_error(infra::ErrorCode::UsageError,
                    fmt::format("Unknown operation '{}' in '{}' (expected t, v, c or b)", letter, token)));
        }
    }
    return ops;
}

auto ModeController::resolve(OperationSet requested) -> ModeResolution {
    const unsigned bits = requested.bits();
    for (const auto& rule : kRules) {
        if ((bits & rule.required) == rule.required && (bits & rule.forbidden) == 0) {
            return ModeResolution{rule.plan, rule.label};
        }
    }
    // The table covers all eight combinations
    return ModeResolution{kRules.front().plan, kRules.front().label};
}

} // namespace dirshift::core
