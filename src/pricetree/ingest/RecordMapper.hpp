#pragma once
#include "core/Error.hpp"
#include "core/Period.hpp"
#include "ingest/CsvReader.hpp"
#include "ingest/FlatRecord.hpp"

#include <array>
#include <string>
#include <vector>

namespace PT {

// Source column names, defaulting to the headers of the published detailed
// index table for February 2025.
struct ColumnMapping {
    std::string                           code{"Numéro"};
    std::string                           name{"Regroupement"};
    std::string                           weight{"Pondération"};
    std::array<std::string, kPeriodCount> indices{
            "Indice février 2024", "Indice novembre 2024", "Indice décembre 2024", "Indice janvier 2025",
            "Indice février 2025"};
};

// MissingColumn when the code column is absent. Any other absent column reads
// as empty text for every row.
[[nodiscard]] auto mapRecords(CsvTable const& table, ColumnMapping const& columns) -> Expected<std::vector<FlatRecord>>;

} // namespace PT
