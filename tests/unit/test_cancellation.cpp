#include <gtest/gtest.h>
#include "relaysave/core/cancellation.hpp"
#include <csignal>

using namespace relaysave::core;

namespace {

volatile std::sig_atomic_t outer_handler_calls = 0;

void count_interrupt(int) {
    outer_handler_calls = outer_handler_calls + 1;
}

}

class InterruptGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        outer_handler_calls = 0;
        std::signal(SIGINT, count_interrupt);
    }

    void TearDown() override {
        std::signal(SIGINT, SIG_DFL);
    }
};

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;

    EXPECT_FALSE(copy.is_cancelled());
    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());
}

TEST_F(InterruptGuardTest, InterruptCancelsGuardedToken) {
    CancellationToken token;
    {
        InterruptGuard guard(token);
        ASSERT_EQ(std::raise(SIGINT), 0);
        EXPECT_TRUE(token.is_cancelled());
        EXPECT_EQ(outer_handler_calls, 0);
    }
}

TEST_F(InterruptGuardTest, PreviousHandlerRestored) {
    CancellationToken first;
    {
        InterruptGuard guard(first);
    }

    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_FALSE(first.is_cancelled());
    EXPECT_EQ(outer_handler_calls, 1);
}

TEST_F(InterruptGuardTest, LaterGuardCancelsOnlyItsToken) {
    CancellationToken first;
    CancellationToken second;
    {
        InterruptGuard guard(first);
    }
    {
        InterruptGuard guard(second);
        ASSERT_EQ(std::raise(SIGINT), 0);
    }

    EXPECT_FALSE(first.is_cancelled());
    EXPECT_TRUE(second.is_cancelled());
}
