/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Cancellation tokens and the signal-driven canceller
 */

#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <thread>

#include "cancellation.h"
#include "errors.h"

using namespace textvault;

TEST(CancellationTest, TokenFollowsSource) {
    CancellationSource src;
    CancellationToken token = src.token();
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_NO_THROW(token.throw_if_cancelled());

    src.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_THROW(token.throw_if_cancelled(), OperationCancelled);
    EXPECT_FALSE(CancellationToken::none().is_cancelled());
}

TEST(CancellationTest, WaitEndsEarlyOnCancel) {
    CancellationSource src;
    std::thread t([src]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        src.cancel();
    });

    auto begin = std::chrono::steady_clock::now();
    EXPECT_TRUE(src.token().wait_for(std::chrono::seconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
    t.join();
}

TEST(InterruptCancellerTest, SignalCancelsSource) {
    CancellationSource src;
    CancellationToken token = src.token();
    {
        InterruptCanceller guard(src, SIGUSR1);
        ASSERT_EQ(std::raise(SIGUSR1), 0);
        EXPECT_TRUE(token.wait_for(std::chrono::seconds(5)));
    }
    EXPECT_TRUE(src.is_cancelled());
}

TEST(InterruptCancellerTest, OtherSignalsAreIgnored) {
    CancellationSource src;
    std::signal(SIGUSR2, SIG_IGN);
    {
        InterruptCanceller guard(src, SIGUSR1);
        ASSERT_EQ(std::raise(SIGUSR2), 0);
        EXPECT_FALSE(src.token().wait_for(std::chrono::milliseconds(100)));
    }
    EXPECT_FALSE(src.is_cancelled());
    std::signal(SIGUSR2, SIG_DFL);
}

TEST(InterruptCancellerTest, PreviousHandlerRestored) {
    std::signal(SIGUSR1, SIG_IGN);
    {
        CancellationSource src;
        InterruptCanceller guard(src, SIGUSR1);
    }
    EXPECT_EQ(std::signal(SIGUSR1, SIG_DFL), SIG_IGN);
}
