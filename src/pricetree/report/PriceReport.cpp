#include "report/PriceReport.hpp"

#include "ingest/CsvReader.hpp"
#include "ingest/RecordMapper.hpp"
#include "log/TaggedLogger.hpp"
#include "session/EditSession.hpp"
#include "snapshot/TreeStats.hpp"
#include "view/TreeView.hpp"

#include <string>
#include <utility>

namespace PT {

namespace {

auto renderTree(CategoryTree const& tree, PriceReportRequest const& request) -> Expected<std::string> {
    if (request.format == ReportFormat::Json) {
        auto options       = request.json;
        options.periodKeys = request.load.periodLabels;
        return TreeJsonExporter::Export(tree, options);
    }

    ExpansionState expansion;
    if (request.expandAll) {
        expansion.expandAll(tree);
    } else {
        expansion.expand(CategoryTree::kRootCode);
        for (auto const& code : request.expanded) {
            expansion.expand(code);
        }
    }
    TableLabels labels;
    labels.periods = request.load.periodLabels;
    return renderTable(visibleRows(tree, expansion), labels);
}

} // namespace

auto runPriceReport(PriceReportRequest const& request) -> Expected<PriceReport> {
    auto table = CsvReader::readFile(request.input, request.load.delimiter);
    if (!table) {
        return std::unexpected(table.error());
    }
    auto records = mapRecords(*table, request.load.columns);
    if (!records) {
        return std::unexpected(records.error());
    }

    TreeBuilder builder(request.load.build);
    EditSession session(builder.build(*records));

    for (auto const& edit : request.edits) {
        auto applied = session.applyWeight(edit.code, edit.weight);
        if (!applied) {
            auto const& error = applied.error();
            return std::unexpected(Error{error.code, edit.code + ": " + error.message.value_or("")});
        }
    }

    auto const& tree = session.current();
    if (request.validate) {
        if (auto valid = validateTree(tree, request.tolerance); !valid) {
            return std::unexpected(valid.error());
        }
    }

    auto text = renderTree(tree, request);
    if (!text) {
        return std::unexpected(text.error());
    }
    pt_log("Rendered " + std::to_string(tree.nodeCount()) + " categories after "
                   + std::to_string(session.editCount()) + " edits",
           "PriceReport", "INFO");

    PriceReport report;
    report.text         = std::move(*text);
    report.build        = builder.lastReport();
    report.tree         = tree;
    report.editsApplied = session.editCount();
    return report;
}

} // namespace PT
