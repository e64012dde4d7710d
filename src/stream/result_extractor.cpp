#include "stream/result_extractor.hpp"

#include <cctype>

#include "core/logging/logger.hpp"

namespace agentcli::stream {

using nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<json> try_parse(const std::string& candidate) {
    if (candidate.empty()) {
        return std::nullopt;
    }
    json parsed = json::parse(candidate, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

// ```lang\n ... ``` ; the language tag is optional
std::optional<std::string> fenced_block_body(const std::string& text) {
    const auto open = text.find("```");
    if (open == std::string::npos) {
        return std::nullopt;
    }
    std::size_t body_start = open + 3;
    const auto line_end = text.find('\n', body_start);
    if (line_end != std::string::npos) {
        bool tag_only = true;
        for (std::size_t i = body_start; i < line_end; ++i) {
            const auto c = static_cast<unsigned char>(text[i]);
            if (std::isalnum(c) == 0 && c != '-' && c != '_' && c != '+' && c != ' ' &&
                c != '\t' && c != '\r') {
                tag_only = false;
                break;
            }
        }
        if (tag_only) {
            body_start = line_end + 1;
        }
    }

    const auto close = text.find("```", body_start);
    if (close == std::string::npos) {
        return std::nullopt;
    }
    return text.substr(body_start, close - body_start);
}

// Index of the bracket closing the one at open_pos, skipping string literals.
std::size_t find_matching_close(const std::string& text, const std::size_t open_pos) {
    const char open_ch = text[open_pos];
    const char close_ch = open_ch == '{' ? '}' : ']';
    int depth = 0;
    bool in_string = false;
    bool escaped = false;

    for (std::size_t i = open_pos; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == open_ch) {
            ++depth;
        } else if (c == close_ch) {
            --depth;
            if (depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

std::optional<json> first_balanced_value(const std::string& text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '{' && text[i] != '[') {
            continue;
        }
        const auto close = find_matching_close(text, i);
        if (close == std::string::npos) {
            continue;
        }
        if (auto parsed = try_parse(text.substr(i, close - i + 1))) {
            return parsed;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<json> extract_structured(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    if (auto whole = try_parse(trimmed)) {
        return whole;
    }

    if (auto body = fenced_block_body(trimmed)) {
        if (auto fenced = try_parse(trim(body.value()))) {
            return fenced;
        }
    }

    if (auto embedded = first_balanced_value(trimmed)) {
        return embedded;
    }

    LOG_DEBUG("ResultExtractor: no JSON value found in " +
              std::to_string(trimmed.size()) + " bytes of output");
    return std::nullopt;
}

}  // namespace agentcli::stream
