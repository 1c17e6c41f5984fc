// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if OBJECT_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::object_transfer {

/**
 * @brief Log categories for object transfer system
 */
struct log_category {
    static constexpr std::string_view descriptor = "object_transfer.descriptor";
    static constexpr std::string_view mode = "object_transfer.mode";
    static constexpr std::string_view command = "object_transfer.command";
    static constexpr std::string_view executor = "object_transfer.executor";
    static constexpr std::string_view process = "object_transfer.process";
    static constexpr std::string_view fallback = "object_transfer.fallback";
    static constexpr std::string_view staging = "object_transfer.staging";
    static constexpr std::string_view storage = "object_transfer.storage";
    static constexpr std::string_view report = "object_transfer.report";
    static constexpr std::string_view engine = "object_transfer.engine";
};

/**
 * @brief Log levels for object transfer system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Credential masking is on by default: presigned object URLs and access key
 * ids show up in tool output and must not reach log sinks verbatim.
 */
struct masking_config {
    bool mask_credentials = true;
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Utility class for masking sensitive information in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    /**
     * @brief Mask sensitive information in a string
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_credentials && !config_.mask_paths) {
            return input;
        }

        std::string result = input;

        if (config_.mask_credentials) {
            result = mask_signed_query(result);
            result = mask_access_keys(result);
        }

        if (config_.mask_paths) {
            result = mask_local_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask a local filesystem path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + path.substr(last_sep);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_value(const std::string& value) const -> std::string {
        if (value.size() <= config_.visible_chars) {
            return std::string(value.size(), config_.mask_char[0]);
        }
        return value.substr(0, config_.visible_chars) +
               std::string(value.size() - config_.visible_chars, config_.mask_char[0]);
    }

    [[nodiscard]] auto mask_signed_query(const std::string& input) const -> std::string {
        static const std::regex query_pattern(
            R"(((?:X-Amz-Signature|X-Amz-Credential|X-Amz-Security-Token|Signature|AWSAccessKeyId)=)([^&\s'"]+))",
            std::regex::icase);

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), query_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += (*it)[1].str();
            result += mask_value((*it)[2].str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_access_keys(const std::string& input) const -> std::string {
        static const std::regex key_pattern(R"(\b(AKIA|ASIA)[A-Z0-9]{16}\b)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), key_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_value(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_local_paths(const std::string& input) const -> std::string {
        // Object URLs (scheme://) are left alone; only bare local paths match.
        static const std::regex path_pattern(R"((^|[\s='"])((?:/[A-Za-z0-9._-]+){2,}))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += (*it)[1].str();
            result += mask_path((*it)[2].str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for object transfer operations
 */
struct transfer_log_context {
    std::string batch_id;
    std::string source;
    std::string destination;
    std::optional<std::string> mode;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> object_count;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    /**
     * @brief Convert context to JSON string with optional masking
     */
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            std::string text = masker ? masker->mask(value) : value;
            oss << "\"" << name << "\":\"" << detail::escape_json_string(text) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!batch_id.empty()) add_field("batch_id", batch_id);
        if (!source.empty()) add_field("source", source);
        if (!destination.empty()) add_field("destination", destination);
        if (mode) add_field("mode", *mode);
        if (attempt) add_uint("attempt", *attempt);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (object_count) add_uint("object_count", *object_count);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source_location\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::executor)
 *     .with_message("Object copied")
 *     .with_batch_id("9f2c01ab")
 *     .with_source("s3://data.binance.vision/data/spot/BTCUSDT-1m.zip")
 *     .with_bytes_transferred(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_batch_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->batch_id = std::string(id);
        return *this;
    }

    auto with_source(std::string_view source) -> log_entry_builder& {
        ensure_context();
        entry_.context->source = std::string(source);
        return *this;
    }

    auto with_destination(std::string_view destination) -> log_entry_builder& {
        ensure_context();
        entry_.context->destination = std::string(destination);
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_transferred = bytes;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class object_transfer_logger;

object_transfer_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Object transfer logging interface
 *
 * Routes through logger_system when it is linked in and falls back to a
 * serialized stderr writer otherwise. Callbacks see every record regardless
 * of the sink.
 */
class object_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    object_transfer_logger() = default;
    ~object_transfer_logger() = default;

    object_transfer_logger(const object_transfer_logger&) = delete;
    object_transfer_logger& operator=(const object_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. transfer_engine::builder::build() calls it.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if OBJECT_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if OBJECT_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if OBJECT_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    /**
     * @brief Suppress stderr output while keeping callbacks active
     */
    void set_console_output(bool enabled) {
        console_output_.store(enabled);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, message, context, file, line, function, current_masker);
        }
    }

    void flush() {
#if OBJECT_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        write(level, json_str, file, line, function);
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        std::ostringstream oss;
#if !OBJECT_TRANSFER_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

        write(level, oss.str(), file, line, function);
    }

    void write(log_level level,
               const std::string& text,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
        if (!console_output_.load()) {
            return;
        }
#if OBJECT_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#else
        (void)level;
#endif
        output_to_stderr(text);
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if OBJECT_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline object_transfer_logger& get_logger() {
    static object_transfer_logger instance;
    return instance;
}

// Logging macros for convenience
#define OT_LOG(level, category, message) \
    kcenon::object_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define OT_LOG_CTX(level, category, message, context) \
    kcenon::object_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define OT_LOG_TRACE(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::trace, category, message)

#define OT_LOG_DEBUG(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::debug, category, message)

#define OT_LOG_INFO(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::info, category, message)

#define OT_LOG_WARN(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::warn, category, message)

#define OT_LOG_ERROR(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::error, category, message)

#define OT_LOG_DEBUG_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::debug, category, message, ctx)

#define OT_LOG_INFO_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::info, category, message, ctx)

#define OT_LOG_WARN_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::warn, category, message, ctx)

#define OT_LOG_ERROR_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::error, category, message, ctx)

} // namespace kcenon::object_transfer
