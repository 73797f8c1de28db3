#include "ingest/RecordMapper.hpp"

#include "log/TaggedLogger.hpp"

#include <optional>
#include <utility>

namespace PT {

namespace {

auto cell(std::vector<std::string> const& row, std::optional<std::size_t> column) -> std::string {
    if (!column || *column >= row.size()) {
        return {};
    }
    return row[*column];
}

auto lookup(CsvTable const& table, std::string const& name) -> std::optional<std::size_t> {
    auto column = table.columnIndex(name);
    if (!column) {
        pt_log("Column '" + name + "' not found; values read as 0", "RecordMapper", "WARN");
    }
    return column;
}

} // namespace

auto mapRecords(CsvTable const& table, ColumnMapping const& columns) -> Expected<std::vector<FlatRecord>> {
    auto const codeColumn = table.columnIndex(columns.code);
    if (!codeColumn) {
        return std::unexpected(Error{Error::Code::MissingColumn, "code column '" + columns.code + "' not found"});
    }
    auto const nameColumn   = lookup(table, columns.name);
    auto const weightColumn = lookup(table, columns.weight);

    std::array<std::optional<std::size_t>, kPeriodCount> indexColumns;
    for (auto const period : kPeriods) {
        auto const slot    = periodSlot(period);
        indexColumns[slot] = lookup(table, columns.indices[slot]);
    }

    std::vector<FlatRecord> records;
    records.reserve(table.rows.size());
    for (auto const& row : table.rows) {
        FlatRecord record;
        record.code   = cell(row, codeColumn);
        record.name   = cell(row, nameColumn);
        record.weight = cell(row, weightColumn);
        for (std::size_t slot = 0; slot < kPeriodCount; ++slot) {
            record.indices[slot] = cell(row, indexColumns[slot]);
        }
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace PT
