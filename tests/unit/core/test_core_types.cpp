/**
 * @file test_core_types.cpp
 * @brief Unit tests for result, error classification and transfer types
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/error_codes.h>
#include <kcenon/object_transfer/core/transfer_types.h>
#include <kcenon/object_transfer/core/types.h>

#include <string>

namespace kcenon::object_transfer::test {

// =============================================================================
// result<T>
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r(42);

    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected{error{error_code::throttled, "SlowDown"}};

    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::throttled);
    EXPECT_EQ(r.error().message, "SlowDown");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    result<void> failed = unexpected{error{error_code::cancelled}};

    EXPECT_TRUE(ok.has_value());
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "cancelled");
}

// =============================================================================
// Error classification
// =============================================================================

class ErrorClassificationTest : public ::testing::Test {};

TEST_F(ErrorClassificationTest, KindsFollowCodeRanges) {
    EXPECT_EQ(classify(error_code::success), error_kind::none);
    EXPECT_EQ(classify(error_code::missing_key), error_kind::invalid_descriptor);
    EXPECT_EQ(classify(error_code::bulk_tool_unavailable), error_kind::mode_unavailable);
    EXPECT_EQ(classify(error_code::invalid_worker_count), error_kind::configuration);
    EXPECT_EQ(classify(error_code::throttled), error_kind::transient);
    EXPECT_EQ(classify(error_code::result_not_reported), error_kind::transient);
    EXPECT_EQ(classify(error_code::object_not_found), error_kind::permanent);
    EXPECT_EQ(classify(error_code::tool_usage_error), error_kind::tool_invocation);
    EXPECT_EQ(classify(error_code::staging_io_error), error_kind::staging);
    EXPECT_EQ(classify(error_code::cancelled), error_kind::cancelled);
    EXPECT_EQ(classify(error_code::internal_error), error_kind::internal);
}

TEST_F(ErrorClassificationTest, RetryableErrors) {
    EXPECT_TRUE(is_retryable(error_code::transient_failure));
    EXPECT_TRUE(is_retryable(error_code::network_timeout));
    EXPECT_TRUE(is_retryable(error_code::process_timeout));
    EXPECT_TRUE(is_retryable(error_code::staging_create_failed));

    EXPECT_FALSE(is_retryable(error_code::access_denied));
    EXPECT_FALSE(is_retryable(error_code::tool_crashed));
    EXPECT_FALSE(is_retryable(error_code::cancelled));
    EXPECT_FALSE(is_retryable(error_code::success));
}

TEST_F(ErrorClassificationTest, BatchFatalErrors) {
    EXPECT_TRUE(is_batch_fatal(error_code::invalid_url));
    EXPECT_TRUE(is_batch_fatal(error_code::mode_unavailable));
    EXPECT_TRUE(is_batch_fatal(error_code::invalid_batch_size));

    EXPECT_FALSE(is_batch_fatal(error_code::throttled));
    EXPECT_FALSE(is_batch_fatal(error_code::tool_not_found));
}

TEST_F(ErrorClassificationTest, EveryCodeHasAName) {
    EXPECT_STREQ(to_string(error_code::tool_not_found), "bulk tool executable not found");
    EXPECT_EQ(to_string(error_kind::tool_invocation), "tool_invocation");
}

// =============================================================================
// Transfer types
// =============================================================================

class TransferTypesTest : public ::testing::Test {};

TEST_F(TransferTypesTest, EnumNames) {
    EXPECT_STREQ(to_string(transfer_mode::automatic), "auto");
    EXPECT_STREQ(to_string(transfer_mode::direct_sync), "direct_sync");
    EXPECT_STREQ(to_string(transfer_status::retried), "retried");
    EXPECT_STREQ(to_string(batch_state::partially_failed), "partially_failed");
}

TEST_F(TransferTypesTest, DefaultOptions) {
    transfer_options options;

    EXPECT_EQ(options.max_batch_size, 1000u);
    EXPECT_EQ(options.max_retries, 3u);
    EXPECT_EQ(options.worker_count, 4u);
}

TEST_F(TransferTypesTest, SourceEntryConversions) {
    source_entry plain = "s3://market-archive/a.zip";
    source_entry sized("s3://market-archive/b.zip", 128);

    EXPECT_EQ(plain.identifier, "s3://market-archive/a.zip");
    EXPECT_FALSE(plain.size_hint.has_value());
    EXPECT_EQ(sized.size_hint, std::optional<uint64_t>(128));
}

TEST_F(TransferTypesTest, RetriedResultIsNotTerminal) {
    object_store_url src{store_family::s3, "data.binance.vision", "a.zip", std::nullopt};
    object_store_url dst{store_family::s3, "market-archive", "binance/a.zip", std::nullopt};
    transfer_descriptor descriptor(object_url{src}, object_url{dst}, std::nullopt);

    transfer_result r(0, descriptor);
    r.status = transfer_status::retried;
    EXPECT_FALSE(r.is_terminal());
    EXPECT_FALSE(r.succeeded());

    r.status = transfer_status::success;
    EXPECT_TRUE(r.is_terminal());
    EXPECT_TRUE(r.succeeded());
}

TEST_F(TransferTypesTest, EmptyBatch) {
    transfer_batch batch;

    EXPECT_TRUE(batch.empty());
    EXPECT_EQ(batch.size(), 0u);
    EXPECT_EQ(batch.state, batch_state::building);
}

}  // namespace kcenon::object_transfer::test
