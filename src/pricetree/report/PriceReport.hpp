#pragma once
#include "build/TreeBuilder.hpp"
#include "config/LoadOptions.hpp"
#include "core/Category.hpp"
#include "core/Error.hpp"
#include "export/TreeJsonExporter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace PT {

enum class ReportFormat { Table, Json };

struct WeightEdit {
    std::string code;
    double      weight = 0.0;
};

struct PriceReportRequest {
    std::filesystem::path    input;
    LoadOptions              load;
    std::vector<WeightEdit>  edits;     // applied in order
    std::vector<std::string> expanded;  // table rows to open besides the root
    bool                     expandAll = false;
    ReportFormat             format    = ReportFormat::Table;
    TreeJsonOptions          json;      // periodKeys are taken from load.periodLabels
    bool                     validate  = false;
    double                   tolerance = 1e-6;
};

struct PriceReport {
    std::string  text;
    BuildReport  build;
    CategoryTree tree;
    std::size_t  editsApplied = 0;
};

/**
 * Loads the table named by the request, builds and aggregates the tree,
 * applies the weight edits through an EditSession, optionally validates the
 * result and renders it as a text table or a JSON document.
 *
 * The first failing step ends the run. A failed edit keeps its error code
 * and prefixes the message with the edited code.
 */
auto runPriceReport(PriceReportRequest const& request) -> Expected<PriceReport>;

} // namespace PT
