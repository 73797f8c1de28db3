#pragma once
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PT {

struct CodeValidation {
    enum class Code {
        None,
        Empty,
        LeadingDot,
        TrailingDot,
        EmptySegment,
        NonDigit
    };
    Code code;
};

// Codes are dot separated digit runs: "01", "01.2", "01.2.15".
constexpr CodeValidation validate_code_impl(std::string_view code) {
    if (code.empty())
        return {CodeValidation::Code::Empty};
    if (code.front() == '.')
        return {CodeValidation::Code::LeadingDot};
    if (code.back() == '.')
        return {CodeValidation::Code::TrailingDot};

    bool prevDot = false;
    for (char c : code) {
        if (c == '.') {
            if (prevDot)
                return {CodeValidation::Code::EmptySegment};
            prevDot = true;
            continue;
        }
        if (c < '0' || c > '9')
            return {CodeValidation::Code::NonDigit};
        prevDot = false;
    }
    return {CodeValidation::Code::None};
}

constexpr auto is_valid_code(std::string_view code) -> bool {
    return validate_code_impl(code).code == CodeValidation::Code::None;
}

auto code_validation_message(CodeValidation::Code code) -> std::string_view;

auto trim_ascii(std::string_view text) -> std::string_view;

// "01.2.3" -> "01.2", "01" -> "". Structural only, the parent may not exist.
auto parent_code(std::string_view code) -> std::string_view;

auto code_segments(std::string_view code) -> std::vector<std::string_view>;

/**
 * True when a record's code marks the dataset's grand-total row: empty,
 * anything that reads completely as the number zero ("0", "00", "0.0"), or
 * one of the extra labels (compared case-insensitively).
 */
auto is_total_sentinel(std::string_view code, std::span<std::string const> extraLabels = {}) -> bool;

struct ClassifiedName {
    std::string displayName;
    int         depth = 0;
};

/**
 * Depth class from the naming convention of the source table: a name that
 * starts with the marker is depth 1, anything else depth 0. The marker is
 * removed from the display name only when whitespace follows it.
 */
auto classify_name(std::string_view rawName, std::string_view marker) -> ClassifiedName;

} // namespace PT
