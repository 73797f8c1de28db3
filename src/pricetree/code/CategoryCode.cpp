#include "code/CategoryCode.hpp"

#include <cctype>

namespace PT {

namespace {

auto is_space(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Optional sign, digits, at most one '.', digits, and every digit a zero.
auto reads_as_zero(std::string_view text) -> bool {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }
    bool sawDigit = false;
    bool sawDot   = false;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c == '.') {
            if (sawDot) {
                return false;
            }
            sawDot = true;
            continue;
        }
        if (c != '0') {
            return false;
        }
        sawDigit = true;
    }
    return sawDigit;
}

} // namespace

auto code_validation_message(CodeValidation::Code code) -> std::string_view {
    switch (code) {
    case CodeValidation::Code::None:
        return "valid";
    case CodeValidation::Code::Empty:
        return "code is empty";
    case CodeValidation::Code::LeadingDot:
        return "code starts with '.'";
    case CodeValidation::Code::TrailingDot:
        return "code ends with '.'";
    case CodeValidation::Code::EmptySegment:
        return "code has an empty segment";
    case CodeValidation::Code::NonDigit:
        return "code segment is not numeric";
    }
    return "unknown";
}

auto trim_ascii(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto parent_code(std::string_view code) -> std::string_view {
    auto const pos = code.rfind('.');
    if (pos == std::string_view::npos) {
        return {};
    }
    return code.substr(0, pos);
}

auto code_segments(std::string_view code) -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    if (code.empty()) {
        return segments;
    }
    std::size_t start = 0;
    for (std::size_t i = 0; i <= code.size(); ++i) {
        if (i == code.size() || code[i] == '.') {
            segments.push_back(code.substr(start, i - start));
            start = i + 1;
        }
    }
    return segments;
}

auto is_total_sentinel(std::string_view code, std::span<std::string const> extraLabels) -> bool {
    auto const trimmed = trim_ascii(code);
    if (trimmed.empty() || reads_as_zero(trimmed)) {
        return true;
    }
    for (auto const& label : extraLabels) {
        if (equals_ignore_case(trimmed, trim_ascii(label))) {
            return true;
        }
    }
    return false;
}

auto classify_name(std::string_view rawName, std::string_view marker) -> ClassifiedName {
    ClassifiedName result;
    if (marker.empty() || !rawName.starts_with(marker)) {
        result.displayName.assign(rawName.begin(), rawName.end());
        return result;
    }
    result.depth = 1;
    auto rest    = rawName.substr(marker.size());
    if (!rest.empty() && is_space(rest.front())) {
        while (!rest.empty() && is_space(rest.front())) {
            rest.remove_prefix(1);
        }
        result.displayName.assign(rest.begin(), rest.end());
    } else {
        result.displayName.assign(rawName.begin(), rawName.end());
    }
    return result;
}

} // namespace PT
