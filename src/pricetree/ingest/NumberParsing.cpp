#include "ingest/NumberParsing.hpp"

#include "code/CategoryCode.hpp"

#include <charconv>
#include <cmath>
#include <string>

namespace PT {

auto parse_lenient_double(std::string_view text, bool decimalComma) -> double {
    auto trimmed = trim_ascii(text);
    if (trimmed.empty()) {
        return 0.0;
    }

    std::string buffer(trimmed.begin(), trimmed.end());
    if (decimalComma) {
        for (auto& c : buffer) {
            if (c == ',') {
                c = '.';
            }
        }
    }

    char const* begin = buffer.data();
    char const* end   = buffer.data() + buffer.size();
    bool negative     = false;
    if (*begin == '+' || *begin == '-') {
        negative = *begin == '-';
        ++begin;
    }
    // from_chars would also read "nan"/"inf"; only digits or '.' may start a number here.
    if (begin == end || !((*begin >= '0' && *begin <= '9') || *begin == '.')) {
        return 0.0;
    }

    double value  = 0.0;
    auto   result = std::from_chars(begin, end, value, std::chars_format::general);
    if (result.ec != std::errc{} || !std::isfinite(value)) {
        return 0.0;
    }
    return negative ? -value : value;
}

} // namespace PT
