#pragma once
#include <string_view>

namespace PT {

/**
 * Reads the longest numeric prefix of text after leading whitespace, the
 * way spreadsheet exports are usually consumed ("12.5 %" -> 12.5). Returns
 * 0 for empty, unparsable or non-finite input. With decimalComma a ','
 * is accepted as the decimal separator ("101,3" -> 101.3).
 */
auto parse_lenient_double(std::string_view text, bool decimalComma = false) -> double;

} // namespace PT
