/**
 * @file output_classifier.cpp
 * @brief Regex-driven tool output classification
 */

#include "kcenon/object_transfer/execution/output_classifier.h"

#include <sstream>

namespace kcenon::object_transfer {

namespace {

constexpr auto icase = std::regex::ECMAScript | std::regex::icase;

auto strip_quotes(std::string token) -> std::string {
    while (!token.empty() && (token.front() == '\'' || token.front() == '"')) {
        token.erase(token.begin());
    }
    while (!token.empty() && (token.back() == '\'' || token.back() == '"')) {
        token.pop_back();
    }
    return token;
}

/// Shell-style word splitting with single quotes, double quotes and
/// backslash escapes, enough to undo batch_command_generator::quote
auto shell_words(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string word;
    bool in_word = false;
    char quote = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            } else if (quote == '"' && c == '\\' && i + 1 < text.size()) {
                word += text[++i];
            } else {
                word += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == '\\' && i + 1 < text.size()) {
            word += text[++i];
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                words.push_back(std::move(word));
                word.clear();
                in_word = false;
            }
        } else {
            word += c;
            in_word = true;
        }
    }
    if (in_word) {
        words.push_back(std::move(word));
    }
    return words;
}

auto trim(const std::string& text) -> std::string {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

/**
 * URLs named by a command echo, in order.
 *
 * Quoted commands (the directive as rendered) are split like a shell would.
 * Unquoted echoes print keys verbatim, spaces included, so each URL runs up
 * to the next scheme; flags always precede the URLs.
 */
auto command_urls(const std::string& command) -> std::vector<std::string> {
    static const std::regex scheme(R"([A-Za-z][A-Za-z0-9+.-]*://)");

    std::vector<std::size_t> starts;
    for (auto it = std::sregex_iterator(command.begin(), command.end(), scheme);
         it != std::sregex_iterator(); ++it) {
        starts.push_back(static_cast<std::size_t>(it->position()));
    }
    if (starts.empty()) {
        return {};
    }

    std::vector<std::string> urls;
    const auto first = starts.front();
    if (first > 0 && (command[first - 1] == '\'' || command[first - 1] == '"')) {
        for (auto& word : shell_words(command)) {
            if (word.find("://") != std::string::npos) {
                urls.push_back(std::move(word));
            }
        }
        return urls;
    }

    for (std::size_t i = 0; i < starts.size(); ++i) {
        const auto end = i + 1 < starts.size() ? starts[i + 1] : command.size();
        auto url = trim(command.substr(starts[i], end - starts[i]));
        if (!url.empty()) {
            urls.push_back(std::move(url));
        }
    }
    return urls;
}

auto group(const std::smatch& match, std::size_t index) -> std::optional<std::string> {
    if (index == 0 || index >= match.size() || !match[index].matched) {
        return std::nullopt;
    }
    return match[index].str();
}

auto parse_size(const std::string& text) -> std::optional<uint64_t> {
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto bytes_in_line(const std::string& line) -> std::optional<uint64_t> {
    static const std::regex bytes_pattern(R"((\d+)\s*bytes?\b)", icase);
    std::smatch match;
    if (std::regex_search(line, match, bytes_pattern)) {
        return parse_size(match[1].str());
    }
    return std::nullopt;
}

auto apply(const classifier_pattern& pattern, const std::smatch& match,
           line_classification& out) {
    if (auto command = group(match, pattern.command_group)) {
        auto urls = command_urls(*command);
        if (!urls.empty()) {
            out.source = urls[0];
        }
        if (urls.size() > 1) {
            out.destination = urls[1];
        }
    }
    if (auto source = group(match, pattern.source_group)) {
        out.source = strip_quotes(*source);
    }
    if (auto destination = group(match, pattern.destination_group)) {
        out.destination = strip_quotes(*destination);
    }
    if (auto size = group(match, pattern.size_group)) {
        out.bytes = parse_size(*size);
    }
    if (auto message = group(match, pattern.message_group)) {
        out.message = *message;
    }
}

}  // namespace

auto classifier_pattern_set::s5cmd_defaults() -> classifier_pattern_set {
    classifier_pattern_set set;

    set.skipped.push_back({std::regex(
        R"re(^DEBUG\s+"((?:cp|sync|mv)\s[^"]*)"\s*:?\s*(.*(?:size matches|same age|newer).*)$)re",
        icase), 0, 0, 1, 0, 2});

    set.failure.push_back({std::regex(
        R"re(^ERROR\s+"((?:cp|sync|mv)\s[^"]*)"\s*:?\s*(.*)$)re"), 0, 0, 1, 0, 2});
    set.failure.push_back({std::regex(
        R"(^(?:ERROR|FAILED)\b\s*:?\s*(.*)$)"), 0, 0, 0, 0, 1});

    set.success.push_back({std::regex(
        R"(^(?:cp|sync|mv)\s+(.*\S)\s*$)"), 0, 0, 1, 0, 0});

    set.removed.push_back({std::regex(
        R"(^rm\s+(.*\S)\s*$)"), 0, 0, 1, 0, 0});

    set.message_rules = {
        {std::regex(R"(NoSuchBucket|bucket .*does not exist)", icase),
         error_code::bucket_not_found},
        {std::regex(R"(NoSuchKey|status code:\s*404|no such file|not found|does not exist)", icase),
         error_code::object_not_found},
        {std::regex(R"(AccessDenied|Forbidden|status code:\s*40[13]|permission denied|InvalidAccessKeyId|SignatureDoesNotMatch)", icase),
         error_code::access_denied},
        {std::regex(R"(InvalidObjectState|InvalidArgument|InvalidRequest|EntityTooLarge|status code:\s*400)", icase),
         error_code::invalid_object},
        {std::regex(R"(SlowDown|Throttl|TooManyRequests|RequestLimitExceeded|status code:\s*(?:429|503))", icase),
         error_code::throttled},
        {std::regex(R"(RequestTimeout|timed? ?out|deadline exceeded)", icase),
         error_code::network_timeout},
        {std::regex(R"(connection (?:reset|refused)|broken pipe|unexpected EOF|no such host|dial tcp)", icase),
         error_code::connection_failed},
        {std::regex(R"(InternalError|ServiceUnavailable|status code:\s*5\d\d)", icase),
         error_code::service_unavailable},
    };

    return set;
}

regex_line_classifier::regex_line_classifier()
    : patterns_(classifier_pattern_set::s5cmd_defaults()) {}

regex_line_classifier::regex_line_classifier(classifier_pattern_set patterns)
    : patterns_(std::move(patterns)) {}

auto regex_line_classifier::error_for_message(const std::string& message) const -> error_code {
    for (const auto& rule : patterns_.message_rules) {
        if (std::regex_search(message, rule.expression)) {
            return rule.code;
        }
    }
    return error_code::transient_failure;
}

auto regex_line_classifier::classify(output_stream /*stream*/, std::string_view raw) const
    -> line_classification {
    line_classification out;
    const std::string line(raw);
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return out;
    }

    std::smatch match;

    for (const auto& pattern : patterns_.skipped) {
        if (std::regex_search(line, match, pattern.expression)) {
            out.kind = line_kind::skipped;
            apply(pattern, match, out);
            out.bytes = 0;
            return out;
        }
    }

    for (const auto& pattern : patterns_.failure) {
        if (std::regex_search(line, match, pattern.expression)) {
            out.kind = line_kind::failure;
            apply(pattern, match, out);
            if (out.message.empty()) {
                out.message = line;
            }
            out.code = error_for_message(out.message);
            return out;
        }
    }

    for (const auto& pattern : patterns_.success) {
        if (std::regex_search(line, match, pattern.expression)) {
            out.kind = line_kind::success;
            apply(pattern, match, out);
            if (!out.bytes) {
                out.bytes = bytes_in_line(line);
            }
            return out;
        }
    }

    for (const auto& pattern : patterns_.removed) {
        if (std::regex_search(line, match, pattern.expression)) {
            out.kind = line_kind::removed;
            apply(pattern, match, out);
            return out;
        }
    }

    out.message = line;
    return out;
}

}  // namespace kcenon::object_transfer
