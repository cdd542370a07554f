#include "voxturn/cancellation_token.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace voxturn;

TEST(CancellationTokenTest, StartsNotCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_EQ(token.reason(), "");
    EXPECT_FALSE(token.waitFor(std::chrono::milliseconds(1)));
}

TEST(CancellationTokenTest, CancelIsIdempotentAndFirstReasonWins) {
    CancellationToken token;
    EXPECT_TRUE(token.cancel("first"));
    EXPECT_FALSE(token.cancel("second"));
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), "first");
}

TEST(CancellationTokenTest, DefaultReason) {
    CancellationToken token;
    token.cancel();
    EXPECT_EQ(token.reason(), "Cancelled by user");
}

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    copy.cancel("from copy");
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), "from copy");
}

TEST(CancellationTokenTest, AwaitCancelledWakesUp) {
    CancellationToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel("timeout");
    });
    EXPECT_EQ(token.awaitCancelled(), "timeout");
    canceller.join();
}

TEST(CancellationTokenTest, WaitForReturnsTrueOnceCancelled) {
    CancellationToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    EXPECT_TRUE(token.waitFor(std::chrono::seconds(5)));
    canceller.join();
}

TEST(CancellationTokenTest, CallbacksFireOnce) {
    CancellationToken token;
    int fired = 0;
    token.subscribe([&fired] { fired++; });
    token.cancel();
    token.cancel();
    EXPECT_EQ(fired, 1);
}

TEST(CancellationTokenTest, SubscribeAfterCancelRunsImmediately) {
    CancellationToken token;
    token.cancel();
    bool fired = false;
    token.subscribe([&fired] { fired = true; });
    EXPECT_TRUE(fired);
}

TEST(CancellationTokenTest, UnsubscribedCallbackDoesNotFire) {
    CancellationToken token;
    bool fired = false;
    size_t id = token.subscribe([&fired] { fired = true; });
    token.unsubscribe(id);
    token.cancel();
    EXPECT_FALSE(fired);
}

TEST(CancellationTokenTest, ScopedSubscription) {
    CancellationToken token;
    int fired = 0;
    {
        CancellationSubscription subscription(token, [&fired] { fired++; });
    }
    token.cancel();
    EXPECT_EQ(fired, 0);
}

TEST(CancellationTokenTest, UnsubscribeWaitsForRunningCallback) {
    CancellationToken token;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};

    size_t id = token.subscribe([&] {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
    });

    std::thread canceller([token] { token.cancel(); });
    while (!entered) {
        std::this_thread::yield();
    }
    token.unsubscribe(id);
    EXPECT_TRUE(finished);
    canceller.join();
}
