/**
 * @file cloud_utils.cpp
 * @brief Helpers shared by the object store clients and the executors
 * @version 0.1.0
 */

#include "kcenon/object_transfer/cloud/cloud_utils.h"

#include "kcenon/object_transfer/config/feature_flags.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <ctime>
#include <random>

#if OBJECT_TRANS_HAS_REQUEST_SIGNING
#include <openssl/evp.h>
#include <openssl/hmac.h>
#endif

namespace kcenon::object_transfer::cloud_utils {

namespace {

constexpr std::size_t digest_size = 32;
constexpr char hex_digits[] = "0123456789abcdef";

auto random_engine() -> std::mt19937_64& {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

auto format_utc(std::chrono::system_clock::time_point tp, const char* format) -> std::string {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::array<char, 32> buffer{};
    const auto written = std::strftime(buffer.data(), buffer.size(), format, &tm);
    return std::string(buffer.data(), written);
}

}  // namespace

// ============================================================================
// SigV4
// ============================================================================

auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        out += hex_digits[byte >> 4];
        out += hex_digits[byte & 0x0f];
    }
    return out;
}

auto url_encode(std::string_view value, bool encode_slash) -> std::string {
    static constexpr char upper_hex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (c == '/' && !encode_slash)) {
            out += c;
        } else {
            out += '%';
            out += upper_hex[byte >> 4];
            out += upper_hex[byte & 0x0f];
        }
    }
    return out;
}

auto sha256_bytes(std::span<const uint8_t> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> digest(digest_size, 0);
#if OBJECT_TRANS_HAS_REQUEST_SIGNING
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        std::fill(digest.begin(), digest.end(), uint8_t{0});
    }
#else
    (void)data;
#endif
    return digest;
}

auto sha256(std::string_view data) -> std::vector<uint8_t> {
    return sha256_bytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

auto hmac_sha256(std::span<const uint8_t> key, std::string_view data) -> std::vector<uint8_t> {
    std::vector<uint8_t> mac(digest_size, 0);
#if OBJECT_TRANS_HAS_REQUEST_SIGNING
    unsigned int length = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac.data(), &length);
    mac.resize(length);
#else
    (void)key;
    (void)data;
#endif
    return mac;
}

auto hmac_sha256(std::string_view key, std::string_view data) -> std::vector<uint8_t> {
    return hmac_sha256(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(key.data()), key.size()),
        data);
}

auto format_iso8601_basic(std::chrono::system_clock::time_point tp) -> std::string {
    return format_utc(tp, "%Y%m%dT%H%M%SZ");
}

auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string {
    return format_utc(tp, "%Y%m%d");
}

// ============================================================================
// Responses and uploads
// ============================================================================

auto extract_xml_element(std::string_view xml, std::string_view tag)
    -> std::optional<std::string> {
    const auto open = "<" + std::string(tag) + ">";
    const auto close = "</" + std::string(tag) + ">";

    const auto start = xml.find(open);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    const auto body = start + open.size();
    const auto end = xml.find(close, body);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(xml.substr(body, end - body));
}

auto detect_content_type(std::string_view key) -> std::string {
    const auto name = key.substr(key.rfind('/') == std::string_view::npos ? 0
                                                                          : key.rfind('/') + 1);
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) {
        return "application/octet-stream";
    }

    std::string extension(name.substr(dot + 1));
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == "zip") return "application/zip";
    if (extension == "gz") return "application/gzip";
    if (extension == "csv") return "text/csv";
    if (extension == "json") return "application/json";
    if (extension == "parquet") return "application/vnd.apache.parquet";
    if (extension == "checksum") return "text/plain";
    return "application/octet-stream";
}

// ============================================================================
// Identifiers and retry
// ============================================================================

auto generate_random_hex(std::size_t byte_count) -> std::string {
    std::uniform_int_distribution<unsigned int> byte(0, 255);
    std::vector<uint8_t> bytes(byte_count);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(byte(random_engine()));
    }
    return bytes_to_hex(bytes);
}

auto calculate_retry_delay(const cloud_retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds {
    const auto exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
    auto delay = static_cast<double>(policy.initial_delay.count()) *
                 std::pow(policy.backoff_multiplier, exponent);
    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        std::uniform_real_distribution<double> factor(0.5, 1.5);
        delay *= factor(random_engine());
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::object_transfer::cloud_utils
