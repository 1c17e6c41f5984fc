/**
 * @file test_traditional_transfer.cpp
 * @brief Unit tests for the download-then-upload path
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/fallback/traditional_transfer.h>
#include <kcenon/object_transfer/storage/local_object_store.h>

#include "../../support/memory_http_client.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::object_transfer::test {

/**
 * @brief local_object_store wrapper that throttles the first uploads and
 *        counts every download and upload it serves
 */
class throttling_upload_store : public object_store_interface {
public:
    throttling_upload_store(std::shared_ptr<local_object_store> inner, int throttled_uploads)
        : inner_(std::move(inner)), throttled_uploads_(throttled_uploads) {}

    [[nodiscard]] auto family() const -> store_family override { return inner_->family(); }
    [[nodiscard]] auto name() const -> std::string_view override { return "throttling"; }

    [[nodiscard]] auto probe(const std::string& bucket) -> result<void> override {
        return inner_->probe(bucket);
    }

    [[nodiscard]] auto head(const object_store_url& url) -> result<object_metadata> override {
        return inner_->head(url);
    }

    [[nodiscard]] auto download(const object_store_url& url,
                                const std::filesystem::path& target)
        -> result<uint64_t> override {
        ++downloads;
        return inner_->download(url, target);
    }

    [[nodiscard]] auto upload(const std::filesystem::path& source, const object_store_url& url)
        -> result<uint64_t> override {
        ++uploads;
        if (throttled_uploads_ > 0) {
            --throttled_uploads_;
            return unexpected{error{error_code::throttled, "SlowDown: Please reduce your request rate."}};
        }
        return inner_->upload(source, url);
    }

    int downloads = 0;
    int uploads = 0;

private:
    std::shared_ptr<local_object_store> inner_;
    int throttled_uploads_;
};

class TraditionalTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("object_trans_trad_" + std::to_string(std::random_device{}()));
        store_ = std::make_shared<local_object_store>(root_ / "store");
        ASSERT_TRUE(store_->create_bucket("data.binance.vision").has_value());
        ASSERT_TRUE(store_->create_bucket("market-archive").has_value());

        stores_ = std::make_shared<object_store_registry>();
        stores_->add(store_);
        http_ = std::make_shared<memory_http_client>();

        staging_config staging;
        staging.root = root_ / "staging";
        staging_ = std::make_shared<staging_area>(staging);

        retry_.max_attempts = 3;
        retry_.initial_delay = std::chrono::milliseconds(1);
        retry_.max_delay = std::chrono::milliseconds(2);
        retry_.use_jitter = false;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    auto make_transfer() -> traditional_transfer {
        return traditional_transfer(stores_, std::make_shared<http_source>(http_), staging_,
                                    retry_);
    }

    static auto descriptor(const std::string& source, const std::string& destination)
        -> transfer_descriptor {
        return transfer_descriptor(object_url::parse(source).value(),
                                   object_url::parse(destination).value());
    }

    auto read_object(const std::string& url) -> std::string {
        std::ifstream file(store_->path_for(object_url::parse(url).value().store()),
                           std::ios::binary);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    auto staging_is_empty() -> bool {
        std::error_code ec;
        return !std::filesystem::exists(root_ / "staging", ec) ||
               std::filesystem::is_empty(root_ / "staging", ec);
    }

    std::filesystem::path root_;
    std::shared_ptr<local_object_store> store_;
    std::shared_ptr<object_store_registry> stores_;
    std::shared_ptr<memory_http_client> http_;
    std::shared_ptr<staging_area> staging_;
    cloud_retry_policy retry_;
};

// =============================================================================
// Store to store
// =============================================================================

TEST_F(TraditionalTransferTest, CopiesBetweenStoresThroughAStage) {
    auto source = object_url::parse("s3://data.binance.vision/klines/a.zip").value();
    ASSERT_TRUE(store_->put(source.store(), "kline bytes").has_value());

    auto transfer = make_transfer();
    auto outcome = transfer.transfer(
        4, descriptor("s3://data.binance.vision/klines/a.zip",
                      "s3://market-archive/binance/klines/a.zip"),
        cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::success);
    EXPECT_EQ(outcome.index, 4u);
    EXPECT_EQ(outcome.mode, transfer_mode::traditional);
    EXPECT_EQ(outcome.operations, 2u);
    EXPECT_EQ(outcome.network_transfers, 2u);
    EXPECT_EQ(outcome.attempt, 1u);
    EXPECT_EQ(outcome.bytes_transferred, 11u);
    EXPECT_EQ(read_object("s3://market-archive/binance/klines/a.zip"), "kline bytes");
    EXPECT_TRUE(staging_is_empty());
    EXPECT_EQ(staging_->active_leases(), 0u);
}

TEST_F(TraditionalTransferTest, MissingSourceFailsPermanently) {
    auto transfer = make_transfer();
    std::vector<transfer_result> retries;

    auto outcome = transfer.transfer(
        0, descriptor("s3://data.binance.vision/klines/missing.zip",
                      "s3://market-archive/klines/missing.zip"),
        cancellation_token{}, [&](const transfer_result& r) { retries.push_back(r); });

    EXPECT_EQ(outcome.status, transfer_status::failed);
    ASSERT_TRUE(outcome.error_detail.has_value());
    EXPECT_EQ(outcome.error_detail->code, error_code::object_not_found);
    EXPECT_EQ(outcome.operations, 1u);
    EXPECT_EQ(outcome.network_transfers, 0u);
    EXPECT_TRUE(retries.empty());
    EXPECT_TRUE(staging_is_empty());
}

TEST_F(TraditionalTransferTest, MissingDestinationBucketFailsAfterDownload) {
    auto source = object_url::parse("s3://data.binance.vision/a.zip").value();
    ASSERT_TRUE(store_->put(source.store(), "x").has_value());

    auto transfer = make_transfer();
    auto outcome = transfer.transfer(
        0, descriptor("s3://data.binance.vision/a.zip", "s3://no-such-bucket/a.zip"),
        cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    ASSERT_TRUE(outcome.error_detail.has_value());
    EXPECT_EQ(outcome.error_detail->code, error_code::bucket_not_found);
    EXPECT_EQ(outcome.operations, 2u);
    EXPECT_EQ(outcome.network_transfers, 1u);
    EXPECT_TRUE(staging_is_empty());
}

TEST_F(TraditionalTransferTest, UnregisteredFamilyIsRejected) {
    auto transfer = make_transfer();

    auto outcome = transfer.transfer(
        0, descriptor("s3://data.binance.vision/a.zip", "gs://market-archive/a.zip"),
        cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    ASSERT_TRUE(outcome.error_detail.has_value());
    EXPECT_EQ(outcome.error_detail->code, error_code::store_not_registered);
    EXPECT_EQ(outcome.operations, 0u);
}

// =============================================================================
// HTTP source
// =============================================================================

TEST_F(TraditionalTransferTest, DownloadsHttpSources) {
    http_->set_object("https://example.com/archive/BTCUSDT.zip", "zip bytes");
    auto transfer = make_transfer();

    auto outcome = transfer.transfer(
        0, descriptor("https://example.com/archive/BTCUSDT.zip",
                      "s3://market-archive/binance/archive/BTCUSDT.zip"),
        cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::success);
    EXPECT_EQ(outcome.operations, 2u);
    EXPECT_EQ(read_object("s3://market-archive/binance/archive/BTCUSDT.zip"), "zip bytes");
}

TEST_F(TraditionalTransferTest, HttpSourceWithoutClientIsRejected) {
    traditional_transfer transfer(stores_, nullptr, staging_, retry_);

    auto outcome = transfer.transfer(
        0, descriptor("https://example.com/a.zip", "s3://market-archive/a.zip"),
        cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    ASSERT_TRUE(outcome.error_detail.has_value());
    EXPECT_EQ(outcome.error_detail->code, error_code::store_not_registered);
}

// =============================================================================
// Retry
// =============================================================================

TEST_F(TraditionalTransferTest, ThrottledDownloadIsRetried) {
    http_->set_object("https://example.com/a.zip", "abc");
    http_->push_status(503);
    auto transfer = make_transfer();
    std::vector<transfer_result> retries;

    auto outcome = transfer.transfer(
        2, descriptor("https://example.com/a.zip", "s3://market-archive/a.zip"),
        cancellation_token{}, [&](const transfer_result& r) { retries.push_back(r); });

    EXPECT_EQ(outcome.status, transfer_status::success);
    EXPECT_EQ(outcome.attempt, 2u);
    EXPECT_EQ(outcome.operations, 3u);
    EXPECT_EQ(outcome.network_transfers, 2u);

    ASSERT_EQ(retries.size(), 1u);
    EXPECT_EQ(retries[0].status, transfer_status::retried);
    EXPECT_EQ(retries[0].index, 2u);
    ASSERT_TRUE(retries[0].error_detail.has_value());
    EXPECT_EQ(retries[0].error_detail->code, error_code::throttled);
}

TEST_F(TraditionalTransferTest, RetryBudgetIsExhausted) {
    http_->set_object("https://example.com/a.zip", "abc");
    http_->fail_connections(5);
    auto transfer = make_transfer();

    auto outcome = transfer.transfer(
        0, descriptor("https://example.com/a.zip", "s3://market-archive/a.zip"),
        cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    ASSERT_TRUE(outcome.error_detail.has_value());
    EXPECT_EQ(outcome.error_detail->code, error_code::connection_failed);
    EXPECT_EQ(outcome.operations, 3u);
    EXPECT_EQ(outcome.attempt, 3u);
    EXPECT_TRUE(staging_is_empty());
}

TEST_F(TraditionalTransferTest, ThrottledUploadRetriesWithoutDownloadingAgain) {
    auto source = object_url::parse("s3://data.binance.vision/klines/a.zip").value();
    ASSERT_TRUE(store_->put(source.store(), "kline bytes").has_value());
    auto throttling = std::make_shared<throttling_upload_store>(store_, 1);
    stores_->add(throttling);
    auto transfer = make_transfer();
    std::vector<transfer_result> retries;

    auto outcome = transfer.transfer(
        0, descriptor("s3://data.binance.vision/klines/a.zip",
                      "s3://market-archive/binance/klines/a.zip"),
        cancellation_token{}, [&](const transfer_result& r) { retries.push_back(r); });

    EXPECT_EQ(outcome.status, transfer_status::success);
    EXPECT_EQ(throttling->downloads, 1);
    EXPECT_EQ(throttling->uploads, 2);
    EXPECT_EQ(outcome.operations, 3u);
    EXPECT_EQ(outcome.network_transfers, 2u);
    EXPECT_EQ(outcome.attempt, 2u);
    ASSERT_EQ(retries.size(), 1u);
    EXPECT_EQ(retries[0].error_detail->code, error_code::throttled);
    EXPECT_EQ(read_object("s3://market-archive/binance/klines/a.zip"), "kline bytes");
    EXPECT_TRUE(staging_is_empty());
}

TEST_F(TraditionalTransferTest, UploadRetryBudgetKeepsSingleDownload) {
    auto source = object_url::parse("s3://data.binance.vision/klines/a.zip").value();
    ASSERT_TRUE(store_->put(source.store(), "kline bytes").has_value());
    auto throttling = std::make_shared<throttling_upload_store>(store_, 10);
    stores_->add(throttling);
    auto transfer = make_transfer();

    auto outcome = transfer.transfer(
        0, descriptor("s3://data.binance.vision/klines/a.zip",
                      "s3://market-archive/binance/klines/a.zip"),
        cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    EXPECT_EQ(outcome.error_detail->code, error_code::throttled);
    EXPECT_EQ(throttling->downloads, 1);
    EXPECT_EQ(throttling->uploads, 3);
    EXPECT_EQ(outcome.operations, 4u);
    EXPECT_EQ(outcome.network_transfers, 1u);
    EXPECT_TRUE(staging_is_empty());
}

TEST_F(TraditionalTransferTest, CancelledTokenStopsBeforeDownload) {
    auto source = object_url::parse("s3://data.binance.vision/a.zip").value();
    ASSERT_TRUE(store_->put(source.store(), "x").has_value());
    cancellation_source source_cancel;
    source_cancel.cancel();
    auto transfer = make_transfer();

    auto outcome = transfer.transfer(
        0, descriptor("s3://data.binance.vision/a.zip", "s3://market-archive/a.zip"),
        source_cancel.token());

    EXPECT_EQ(outcome.status, transfer_status::failed);
    ASSERT_TRUE(outcome.error_detail.has_value());
    EXPECT_EQ(outcome.error_detail->code, error_code::cancelled);
    EXPECT_EQ(outcome.operations, 0u);
    EXPECT_FALSE(std::filesystem::exists(
        store_->path_for(object_url::parse("s3://market-archive/a.zip").value().store())));
}

}  // namespace kcenon::object_transfer::test
