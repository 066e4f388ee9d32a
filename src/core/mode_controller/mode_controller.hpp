#pragma once

#include <string_view>
#include "../../infra/error_handler/error.hpp"

namespace dirshift::core {

enum class Operation : unsigned {
    Transfer = 1u << 0,
    Validate = 1u << 1,
    Cleanup  = 1u << 2,
};

/// Requested operations, independent of how they were spelled on the command line.
class OperationSet {
public:
    constexpr OperationSet() = default;

    constexpr auto add(Operation op) -> OperationSet& {
        bits_ |= static_cast<unsigned>(op);
        return *this;
    }
    constexpr auto merge(OperationSet other) -> OperationSet& {
        bits_ |= other.bits_;
        return *this;
    }
    [[nodiscard]] constexpr auto contains(Operation op) const -> bool {
        return (bits_ & static_cast<unsigned>(op)) != 0;
    }
    [[nodiscard]] constexpr auto empty() const -> bool { return bits_ == 0; }
    [[nodiscard]] constexpr auto bits() const -> unsigned { return bits_; }

    constexpr bool operator==(const OperationSet&) const = default;

private:
    unsigned bits_ = 0;
};

/// Scans a letter token once: 't' transfer, 'v' validate, 'c' cleanup,
/// 'b' both (transfer + validate). Anything else is a UsageError.
[[nodiscard]] auto parse_operation_letters(std::string_view token) -> infra::Result<OperationSet>;

struct ExecutionPlan {
    bool do_copy = true;
    bool do_verify = true;
    bool do_cleanup_prompt = true;

    bool operator==(const ExecutionPlan&) const = default;
};

struct ModeResolution {
    ExecutionPlan plan;
    std::string_view label;
};

class ModeController {
public:
    // Total over every OperationSet; the empty set selects the full plan.
    [[nodiscard]] static auto resolve(OperationSet requested) -> ModeResolution;
};

} // namespace dirshift::core
