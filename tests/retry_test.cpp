#include "gtest/gtest.h"
#include "sflp/errors.h"
#include "sflp/retry.h"

namespace
{

TEST(WithRetryTest, SecondAttemptSucceeds)
{
    int calls = 0;
    auto flaky = [&]()
    {
        if (++calls == 1)
            throw SolverFailureError("first attempt");
        return 7;
    };
    EXPECT_EQ(with_retry("flaky", flaky), 7);
    EXPECT_EQ(calls, 2);
}

TEST(WithRetryTest, SecondFailureIsFatal)
{
    int calls = 0;
    auto broken = [&]() -> int
    {
        ++calls;
        throw SolverFailureError("always");
    };
    EXPECT_THROW(with_retry("broken", broken), SolverFailureError);
    EXPECT_EQ(calls, 2);
}

TEST(WithRetryTest, OtherErrorsAreNotRetried)
{
    int calls = 0;
    auto slow = [&]() -> int
    {
        ++calls;
        throw SolverTimeoutError("no time");
    };
    EXPECT_THROW(with_retry("slow", slow), SolverTimeoutError);
    EXPECT_EQ(calls, 1);

    calls = 0;
    auto infeasible = [&]() -> int
    {
        ++calls;
        throw ModelInfeasibleError("empty");
    };
    EXPECT_THROW(with_retry("infeasible", infeasible), ModelInfeasibleError);
    EXPECT_EQ(calls, 1);
}

TEST(WithRetryTest, NoRetryOnSuccess)
{
    int calls = 0;
    auto ok = [&]()
    {
        ++calls;
        return 2.5;
    };
    EXPECT_DOUBLE_EQ(with_retry("ok", ok), 2.5);
    EXPECT_EQ(calls, 1);
}

} // namespace
