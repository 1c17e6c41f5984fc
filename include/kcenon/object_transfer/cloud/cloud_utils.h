/**
 * @file cloud_utils.h
 * @brief Helpers shared by the object store clients and the executors
 * @version 0.1.0
 *
 * SigV4 building blocks (hex, URI encoding, SHA-256, HMAC, amz dates), S3
 * error body parsing, random identifiers for batches and staging files, and
 * the retry backoff used by both transfer paths.
 */

#ifndef KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_UTILS_H
#define KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_UTILS_H

#include "cloud_config.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_transfer::cloud_utils {

// ============================================================================
// SigV4
// ============================================================================

/**
 * @brief Lowercase hex digest
 */
auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief SigV4 URI encoding: everything but A-Z a-z 0-9 - _ . ~ is escaped
 * @param encode_slash false for object key paths, true for query values
 */
auto url_encode(std::string_view value, bool encode_slash = true) -> std::string;

/**
 * @brief SHA-256 digest; 32 zero bytes when built without request signing
 */
auto sha256_bytes(std::span<const uint8_t> data) -> std::vector<uint8_t>;

auto sha256(std::string_view data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256 for the signing key chain; zeros without request signing
 */
auto hmac_sha256(std::span<const uint8_t> key, std::string_view data) -> std::vector<uint8_t>;

auto hmac_sha256(std::string_view key, std::string_view data) -> std::vector<uint8_t>;

/// x-amz-date, YYYYMMDDTHHMMSSZ in UTC
auto format_iso8601_basic(std::chrono::system_clock::time_point tp) -> std::string;

/// Credential scope date, YYYYMMDD in UTC
auto format_date_stamp(std::chrono::system_clock::time_point tp) -> std::string;

// ============================================================================
// Responses and uploads
// ============================================================================

/**
 * @brief Text of the first <tag>...</tag> in an S3 error body
 */
auto extract_xml_element(std::string_view xml, std::string_view tag)
    -> std::optional<std::string>;

/**
 * @brief Content-Type for an uploaded object, from its key's extension
 *
 * Covers the archive, checksum and tabular files market data ships as;
 * anything else is application/octet-stream.
 */
auto detect_content_type(std::string_view key) -> std::string;

// ============================================================================
// Identifiers and retry
// ============================================================================

/**
 * @brief Random lowercase hex string of 2 * byte_count characters
 */
auto generate_random_hex(std::size_t byte_count) -> std::string;

/**
 * @brief Backoff before retrying after failed attempt `attempt` (1-based)
 *
 * initial_delay * backoff_multiplier^(attempt - 1), capped at max_delay,
 * then scaled by a factor in [0.5, 1.5] when use_jitter is set.
 */
auto calculate_retry_delay(const cloud_retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds;

}  // namespace kcenon::object_transfer::cloud_utils

#endif  // KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_UTILS_H
