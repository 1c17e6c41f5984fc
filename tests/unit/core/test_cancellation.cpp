/**
 * @file test_cancellation.cpp
 * @brief Unit tests for cancellation tokens
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/cancellation.h>

#include <chrono>
#include <thread>

namespace kcenon::object_transfer::test {

class CancellationTest : public ::testing::Test {};

TEST_F(CancellationTest, DefaultTokenIsNeverCancelled) {
    cancellation_token token;

    EXPECT_FALSE(token.is_cancelled());
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(1)));
}

TEST_F(CancellationTest, TokensShareTheSourceState) {
    cancellation_source source;
    auto first = source.token();
    auto second = first;

    EXPECT_FALSE(first.is_cancelled());
    source.cancel();

    EXPECT_TRUE(source.is_cancelled());
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_TRUE(second.is_cancelled());
}

TEST_F(CancellationTest, WaitReturnsEarlyOnCancel) {
    cancellation_source source;
    auto token = source.token();

    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(10)));
    auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(waited, std::chrono::seconds(5));
}

TEST_F(CancellationTest, WaitTimesOutWithoutCancel) {
    cancellation_source source;

    EXPECT_FALSE(source.token().wait_for(std::chrono::milliseconds(5)));
}

}  // namespace kcenon::object_transfer::test
