/**
 * @file test_cloud_utils.cpp
 * @brief Unit tests for the object store client utilities
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/cloud/cloud_utils.h>
#include <kcenon/object_transfer/cloud/http_client.h>
#include <kcenon/object_transfer/config/feature_flags.h>

#include <string>
#include <vector>

namespace kcenon::object_transfer::test {

using namespace cloud_utils;

class CloudUtilsTest : public ::testing::Test {};

TEST_F(CloudUtilsTest, UrlEncode) {
    EXPECT_EQ(url_encode("a b/c~d"), "a%20b%2Fc~d");
    EXPECT_EQ(url_encode("/data/spot/a b.zip", false), "/data/spot/a%20b.zip");
    EXPECT_EQ(url_encode("k=v&x"), "k%3Dv%26x");
}

TEST_F(CloudUtilsTest, BytesToHex) {
    const std::vector<uint8_t> bytes{0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(bytes_to_hex(bytes), "000fabff");
    EXPECT_EQ(generate_random_hex(8).size(), 16u);
    EXPECT_NE(generate_random_hex(8), generate_random_hex(8));
}

TEST_F(CloudUtilsTest, Sha256OfEmptyString) {
#if !OBJECT_TRANS_HAS_REQUEST_SIGNING
    GTEST_SKIP() << "built without request signing";
#else
    EXPECT_EQ(bytes_to_hex(sha256("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
#endif
}

TEST_F(CloudUtilsTest, HmacSha256KnownAnswer) {
#if !OBJECT_TRANS_HAS_REQUEST_SIGNING
    GTEST_SKIP() << "built without request signing";
#else
    // RFC 4231 test case 2
    EXPECT_EQ(bytes_to_hex(hmac_sha256(std::string("Jefe"), "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    const auto chained = hmac_sha256(hmac_sha256(std::string("AWS4secret"), "20240101"),
                                     "ap-northeast-1");
    EXPECT_EQ(chained.size(), 32u);
#endif
}

TEST_F(CloudUtilsTest, TimeFormats) {
    // 2024-01-01T12:34:56Z
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1704112496));

    EXPECT_EQ(format_iso8601_basic(tp), "20240101T123456Z");
    EXPECT_EQ(format_date_stamp(tp), "20240101");
}

TEST_F(CloudUtilsTest, ExtractXmlElement) {
    const std::string body =
        "<Error><Code>SlowDown</Code><Message>Please reduce your request rate.</Message></Error>";

    EXPECT_EQ(extract_xml_element(body, "Code"), "SlowDown");
    EXPECT_EQ(extract_xml_element(body, "Message"), "Please reduce your request rate.");
    EXPECT_FALSE(extract_xml_element(body, "RequestId").has_value());
}

TEST_F(CloudUtilsTest, ContentType) {
    EXPECT_EQ(detect_content_type("data/spot/daily/BTCUSDT-1m.zip"), "application/zip");
    EXPECT_EQ(detect_content_type("a/BTCUSDT-1m.zip.CHECKSUM"), "text/plain");
    EXPECT_EQ(detect_content_type("a/b.bin"), "application/octet-stream");
    EXPECT_EQ(detect_content_type("dir.v2/noext"), "application/octet-stream");
}

TEST_F(CloudUtilsTest, RetryDelayBackoff) {
    cloud_retry_policy policy;
    policy.initial_delay = std::chrono::milliseconds(100);
    policy.max_delay = std::chrono::milliseconds(1000);
    policy.backoff_multiplier = 2.0;
    policy.use_jitter = false;

    EXPECT_EQ(calculate_retry_delay(policy, 1), std::chrono::milliseconds(100));
    EXPECT_EQ(calculate_retry_delay(policy, 2), std::chrono::milliseconds(200));
    EXPECT_EQ(calculate_retry_delay(policy, 3), std::chrono::milliseconds(400));
    EXPECT_EQ(calculate_retry_delay(policy, 10), std::chrono::milliseconds(1000));
}

TEST_F(CloudUtilsTest, RetryDelayJitterStaysInRange) {
    cloud_retry_policy policy;
    policy.initial_delay = std::chrono::milliseconds(100);
    policy.use_jitter = true;

    for (int i = 0; i < 50; ++i) {
        auto delay = calculate_retry_delay(policy, 1);
        EXPECT_GE(delay.count(), 50);
        EXPECT_LE(delay.count(), 150);
    }
}

TEST_F(CloudUtilsTest, StatusMapping) {
    EXPECT_EQ(error_from_status(200), error_code::success);
    EXPECT_EQ(error_from_status(403), error_code::access_denied);
    EXPECT_EQ(error_from_status(404), error_code::object_not_found);
    EXPECT_EQ(error_from_status(429), error_code::throttled);
    EXPECT_EQ(error_from_status(500), error_code::service_unavailable);
    EXPECT_EQ(error_from_status(400), error_code::permanent_failure);
}

}  // namespace kcenon::object_transfer::test
