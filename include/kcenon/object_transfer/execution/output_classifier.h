/**
 * @file output_classifier.h
 * @brief Classification of bulk tool output lines
 * @version 0.1.0
 *
 * The executor hands every stdout/stderr line of the bulk tool to a
 * line_classifier and maps the classification back to a descriptor. Tool
 * output formats change between releases, so all knowledge of them lives in a
 * classifier_pattern_set.
 *
 * Lines recognized by classifier_pattern_set::s5cmd_defaults():
 * @code
 * cp s3://src/a.zip s3://dst/a.zip
 * DEBUG "cp s3://src/a.zip s3://dst/a.zip": object size matches
 * ERROR "cp s3://src/b.zip s3://dst/b.zip": NoSuchKey: ... status code: 404
 * ERROR failed to copy object
 * @endcode
 */

#ifndef KCENON_OBJECT_TRANSFER_EXECUTION_OUTPUT_CLASSIFIER_H
#define KCENON_OBJECT_TRANSFER_EXECUTION_OUTPUT_CLASSIFIER_H

#include "process_runner.h"

#include "kcenon/object_transfer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief What a tool output line says about an object
 */
enum class line_kind {
    success,       ///< Object copied
    skipped,       ///< Conditional copy left the destination as is
    failure,       ///< Object failed
    removed,       ///< Sync deleted an extraneous destination object
    unrecognized,  ///< Not an object result line
};

[[nodiscard]] constexpr auto to_string(line_kind kind) -> const char* {
    switch (kind) {
        case line_kind::success: return "success";
        case line_kind::skipped: return "skipped";
        case line_kind::failure: return "failure";
        case line_kind::removed: return "removed";
        case line_kind::unrecognized: return "unrecognized";
        default: return "unknown";
    }
}

/**
 * @brief Result of classifying one line
 *
 * A result line without source or destination is positional. It is mapped
 * by position only inside a document that produced no identified line.
 */
struct line_classification {
    line_kind kind = line_kind::unrecognized;
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<uint64_t> bytes;

    /// Error for failure lines; success otherwise
    error_code code = error_code::success;
    std::string message;

    [[nodiscard]] auto is_object_result() const noexcept -> bool {
        return kind == line_kind::success || kind == line_kind::skipped ||
               kind == line_kind::failure;
    }

    [[nodiscard]] auto is_identified() const noexcept -> bool {
        return source.has_value() || destination.has_value();
    }
};

/**
 * @brief Tool output parsing seam
 */
class line_classifier {
public:
    virtual ~line_classifier() = default;

    [[nodiscard]] virtual auto classify(output_stream stream, std::string_view line) const
        -> line_classification = 0;
};

/**
 * @brief One line pattern with the meaning of its capture groups
 *
 * Group index 0 means "not captured". When command_group is set, the source
 * and destination are the first two URLs of that capture, so flags echoed
 * before them are skipped. Quoted URLs are unquoted; unquoted URLs may
 * contain spaces.
 */
struct classifier_pattern {
    std::regex expression;
    std::size_t source_group = 0;
    std::size_t destination_group = 0;
    std::size_t command_group = 0;
    std::size_t size_group = 0;
    std::size_t message_group = 0;
};

/**
 * @brief Maps a failure message to an error code
 */
struct message_rule {
    std::regex expression;
    error_code code;
};

/**
 * @brief Pattern configuration of regex_line_classifier
 *
 * Patterns are tried in the order skipped, failure, success, removed. Failure
 * messages are matched against message_rules in order; a message no rule
 * matches becomes error_code::transient_failure.
 */
struct classifier_pattern_set {
    std::vector<classifier_pattern> success;
    std::vector<classifier_pattern> skipped;
    std::vector<classifier_pattern> failure;
    std::vector<classifier_pattern> removed;
    std::vector<message_rule> message_rules;

    /**
     * @brief Patterns for the s5cmd v2 text output format
     */
    [[nodiscard]] static auto s5cmd_defaults() -> classifier_pattern_set;
};

/**
 * @brief line_classifier driven by a classifier_pattern_set
 */
class regex_line_classifier : public line_classifier {
public:
    regex_line_classifier();
    explicit regex_line_classifier(classifier_pattern_set patterns);

    [[nodiscard]] auto classify(output_stream stream, std::string_view line) const
        -> line_classification override;

    /**
     * @brief Error code for a failure message
     */
    [[nodiscard]] auto error_for_message(const std::string& message) const -> error_code;

private:
    classifier_pattern_set patterns_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_EXECUTION_OUTPUT_CLASSIFIER_H
