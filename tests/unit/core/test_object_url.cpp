/**
 * @file test_object_url.cpp
 * @brief Unit tests for object URL parsing
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/object_url.h>

#include <string>

namespace kcenon::object_transfer::test {

class ObjectUrlTest : public ::testing::Test {};

TEST_F(ObjectUrlTest, ParsesS3Scheme) {
    auto url = object_url::parse("s3://data.binance.vision/data/spot/BTCUSDT.zip");

    ASSERT_TRUE(url.has_value());
    ASSERT_TRUE(url.value().is_object_store());
    const auto& store = url.value().store();
    EXPECT_EQ(store.store, store_family::s3);
    EXPECT_EQ(store.bucket, "data.binance.vision");
    EXPECT_EQ(store.key, "data/spot/BTCUSDT.zip");
    EXPECT_FALSE(store.region.has_value());
    EXPECT_EQ(url.value().to_string(), "s3://data.binance.vision/data/spot/BTCUSDT.zip");
}

TEST_F(ObjectUrlTest, ParsesGcsScheme) {
    auto url = object_url::parse("gs://market-archive/klines/2024.zip");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().family(), store_family::gcs);
    EXPECT_EQ(url.value().object_key(), "klines/2024.zip");
    EXPECT_EQ(url.value().to_string(), "gs://market-archive/klines/2024.zip");
}

TEST_F(ObjectUrlTest, ParsesVirtualHostedAmazonHost) {
    auto url = object_url::parse(
        "https://data.binance.vision.s3.ap-northeast-1.amazonaws.com/data/spot/a.zip");

    ASSERT_TRUE(url.has_value());
    ASSERT_TRUE(url.value().is_object_store());
    EXPECT_EQ(url.value().store().bucket, "data.binance.vision");
    EXPECT_EQ(url.value().store().key, "data/spot/a.zip");
    EXPECT_EQ(url.value().store().region, std::optional<std::string>("ap-northeast-1"));
}

TEST_F(ObjectUrlTest, ParsesPathStyleAmazonHost) {
    auto url = object_url::parse("https://s3.eu-west-1.amazonaws.com/market-archive/k/a.zip");

    ASSERT_TRUE(url.has_value());
    ASSERT_TRUE(url.value().is_object_store());
    EXPECT_EQ(url.value().store().bucket, "market-archive");
    EXPECT_EQ(url.value().store().key, "k/a.zip");
    EXPECT_EQ(url.value().store().region, std::optional<std::string>("eu-west-1"));
}

TEST_F(ObjectUrlTest, ParsesGoogleStorageHost) {
    auto url = object_url::parse("https://storage.googleapis.com/market-archive/k/a.zip");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().family(), store_family::gcs);
    EXPECT_EQ(url.value().store().bucket, "market-archive");
    EXPECT_EQ(url.value().store().key, "k/a.zip");
}

TEST_F(ObjectUrlTest, OtherHostsBecomeHttpUrls) {
    auto url = object_url::parse("https://example.com/archive/a.zip?token=1");

    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url.value().is_http());
    EXPECT_FALSE(url.value().family().has_value());
    EXPECT_EQ(url.value().object_key(), "archive/a.zip");
    EXPECT_EQ(url.value().to_string(), "https://example.com/archive/a.zip?token=1");
}

TEST_F(ObjectUrlTest, TrimsSurroundingWhitespace) {
    auto url = object_url::parse("  s3://market-archive/a.zip\n");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().store().key, "a.zip");
}

TEST_F(ObjectUrlTest, RejectsMalformedIdentifiers) {
    EXPECT_EQ(object_url::parse("").error().code, error_code::invalid_url);
    EXPECT_EQ(object_url::parse("market-archive/a.zip").error().code, error_code::invalid_url);
    EXPECT_EQ(object_url::parse("ftp://host/a.zip").error().code,
              error_code::unsupported_scheme);
    EXPECT_EQ(object_url::parse("s3:///a.zip").error().code, error_code::missing_bucket);
    EXPECT_EQ(object_url::parse("s3://market-archive").error().code, error_code::missing_key);
    EXPECT_EQ(object_url::parse("s3://market-archive/a\nb.zip").error().code,
              error_code::invalid_url);
    EXPECT_EQ(object_url::parse("s3://market archive/a.zip").error().code,
              error_code::invalid_url);
    EXPECT_EQ(object_url::parse("https://example.com/a b.zip").error().code,
              error_code::invalid_url);
    EXPECT_EQ(object_url::parse("s3://Bad_Bucket/a.zip").error().code, error_code::invalid_url);
}

TEST_F(ObjectUrlTest, StoreKeysMayContainSpaces) {
    auto url = object_url::parse("s3://market-archive/klines/BTC USDT/a b.zip");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().store().key, "klines/BTC USDT/a b.zip");
    EXPECT_EQ(url.value().to_string(), "s3://market-archive/klines/BTC USDT/a b.zip");
}

TEST_F(ObjectUrlTest, KeyIsOptionalForPrefixes) {
    auto url = object_url::parse("s3://market-archive", /*require_key=*/false);

    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url.value().store().key.empty());
}

TEST_F(ObjectUrlTest, ErrorMessageNamesTheIdentifier) {
    auto url = object_url::parse("ftp://mirror/file.zip");

    ASSERT_FALSE(url.has_value());
    EXPECT_NE(url.error().message.find("ftp://mirror/file.zip"), std::string::npos);
}

TEST_F(ObjectUrlTest, BucketNameRules) {
    EXPECT_TRUE(is_valid_bucket_name("data.binance.vision"));
    EXPECT_TRUE(is_valid_bucket_name("abc"));
    EXPECT_FALSE(is_valid_bucket_name("ab"));
    EXPECT_FALSE(is_valid_bucket_name(std::string(64, 'a')));
    EXPECT_FALSE(is_valid_bucket_name("-archive"));
    EXPECT_FALSE(is_valid_bucket_name("archive."));
    EXPECT_FALSE(is_valid_bucket_name("Archive"));
}

TEST_F(ObjectUrlTest, JoinKeyCollapsesSlashes) {
    EXPECT_EQ(join_key("binance/", "/data/a.zip"), "binance/data/a.zip");
    EXPECT_EQ(join_key("", "data/a.zip"), "data/a.zip");
    EXPECT_EQ(join_key("binance", ""), "binance");
}

}  // namespace kcenon::object_transfer::test
