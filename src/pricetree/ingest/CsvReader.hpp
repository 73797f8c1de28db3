#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PT {

struct CsvTable {
    std::vector<std::string>              header;
    std::vector<std::vector<std::string>> rows;

    [[nodiscard]] auto columnIndex(std::string_view name) const -> std::optional<std::size_t>;
};

/**
 * Reader for header-first delimited text.
 *
 * Fields may be quoted with '"' (a doubled quote inside stands for one);
 * quoted fields may span lines. CRLF and LF line ends are accepted, a UTF-8
 * byte order mark is dropped and blank lines are skipped. Every data row must
 * have as many fields as the header.
 */
class CsvReader {
public:
    static constexpr char kAutoDelimiter = '\0';

    // Picks ',', ';' or tab, whichever occurs most often outside quotes in
    // the first line. Falls back to ','.
    [[nodiscard]] static auto detectDelimiter(std::string_view text) -> char;

    [[nodiscard]] static auto parse(std::string_view text, char delimiter = kAutoDelimiter) -> Expected<CsvTable>;

    [[nodiscard]] static auto readFile(std::filesystem::path const& path, char delimiter = kAutoDelimiter)
            -> Expected<CsvTable>;
};

} // namespace PT
