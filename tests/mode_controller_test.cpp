#include <gtest/gtest.h>

#include "core/mode_controller/mode_controller.hpp"

using dirshift::core::ExecutionPlan;
using dirshift::core::ModeController;
using dirshift::core::Operation;
using dirshift::core::OperationSet;
using dirshift::core::parse_operation_letters;

namespace {

auto set_of(bool t, bool v, bool c) -> OperationSet {
    OperationSet ops;
    if (t) ops.add(Operation::Transfer);
    if (v) ops.add(Operation::Validate);
    if (c) ops.add(Operation::Cleanup);
    return ops;
}

constexpr ExecutionPlan kFull{true, true, true};
constexpr ExecutionPlan kVerifyCleanup{false, true, true};
constexpr ExecutionPlan kCopyVerify{true, true, false};
constexpr ExecutionPlan kCopyOnly{true, false, false};
constexpr ExecutionPlan kVerifyOnly{false, true, false};

} // namespace

TEST(ModeControllerTest, EveryCombinationResolves)
{
    struct Case { bool t, v, c; ExecutionPlan expected; };
    const Case cases[] = {
        {false, false, false, kFull},
        {true,  false, false, kCopyOnly},
        {false, true,  false, kVerifyOnly},
        {false, false, true,  kVerifyCleanup},
        {true,  true,  false, kCopyVerify},
        {true,  false, true,  kFull},
        {false, true,  true,  kVerifyCleanup},
        {true,  true,  true,  kFull},
    };

    for (const auto& c : cases) {
        const auto plan = ModeController::resolve(set_of(c.t, c.v, c.c)).plan;
        EXPECT_EQ(plan, c.expected) << "t=" << c.t << " v=" << c.v << " c=" << c.c;
    }
}

TEST(ModeControllerTest, CleanupNeverWithoutVerify)
{
    for (unsigned bits = 0; bits < 8; ++bits) {
        const auto plan = ModeController::resolve(set_of(bits & 1u, bits & 2u, bits & 4u)).plan;
        if (plan.do_cleanup_prompt) {
            EXPECT_TRUE(plan.do_verify) << "bits=" << bits;
        }
    }
}

TEST(ModeControllerTest, LettersAreOrderInsensitive)
{
    auto tc = parse_operation_letters("tc");
    auto ct = parse_operation_letters("ct");
    ASSERT_TRUE(tc.has_value());
    ASSERT_TRUE(ct.has_value());
    EXPECT_EQ(*tc, *ct);
    EXPECT_EQ(ModeController::resolve(*tc).plan, kFull);
}

TEST(ModeControllerTest, BothLetterMeansTransferAndValidate)
{
    auto ops = parse_operation_letters("b");
    ASSERT_TRUE(ops.has_value());
    EXPECT_EQ(ModeController::resolve(*ops).plan, kCopyVerify);
}

TEST(ModeControllerTest, UnknownLetterIsUsageError)
{
    auto ops = parse_operation_letters("tx");
    ASSERT_FALSE(ops.has_value());
    EXPECT_EQ(ops.error().code, dirshift::infra::ErrorCode::UsageError);
}

TEST(ModeControllerTest, LabelsNameTheMode)
{
    EXPECT_EQ(ModeController::resolve(set_of(true, false, false)).label, "Transfer Only");
    EXPECT_EQ(ModeController::resolve(set_of(false, true, false)).label, "Validate Only");
}
