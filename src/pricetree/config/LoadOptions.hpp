#pragma once
#include "build/TreeBuilder.hpp"
#include "core/Error.hpp"
#include "core/Period.hpp"
#include "ingest/CsvReader.hpp"
#include "ingest/RecordMapper.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace PT {

struct LoadOptions {
    ColumnMapping                         columns;
    BuildOptions                          build;
    char                                  delimiter = CsvReader::kAutoDelimiter;
    std::array<std::string, kPeriodCount> periodLabels{"Fév 2024", "Nov 2024", "Déc 2024", "Jan 2025", "Fév 2025"};
};

/**
 * Reads a JSON configuration file on top of the defaults:
 *
 *   {
 *     "columns": {"code": "...", "name": "...", "weight": "...", "indices": [5 names]},
 *     "period_labels": [5 labels],
 *     "depth_marker": "__",
 *     "total_labels": ["total"],
 *     "decimal_comma": false,
 *     "delimiter": ";"
 *   }
 *
 * Every key is optional and unknown keys are ignored. A key with the wrong
 * type, or an array of the wrong length, is an InvalidConfig error.
 */
auto LoadOptionsFromJson(std::filesystem::path const& path, LoadOptions base = {}) -> Expected<LoadOptions>;
auto LoadOptionsFromJsonText(std::string const& text, LoadOptions base = {}) -> Expected<LoadOptions>;

// PRICETREE_DELIMITER, PRICETREE_DEPTH_MARKER, PRICETREE_DECIMAL_COMMA.
// Returns false and reports on stderr when a value is unusable.
bool ApplyLoadEnvOverrides(LoadOptions& options);

auto ValidateLoadOptions(LoadOptions const& options) -> std::optional<std::string>;

// "," ";" "tab" "\t" "|" or "auto". Empty optional for anything else.
auto ParseDelimiter(std::string_view text) -> std::optional<char>;

} // namespace PT
