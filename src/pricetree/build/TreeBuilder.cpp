#include "build/TreeBuilder.hpp"

#include "aggregate/IndexAggregator.hpp"
#include "aggregate/IndexFormula.hpp"
#include "code/CategoryCode.hpp"
#include "ingest/NumberParsing.hpp"
#include "log/TaggedLogger.hpp"

#include <memory>
#include <string_view>
#include <utility>

#include <parallel_hashmap/phmap.h>

namespace PT {

namespace {

auto makeCategory(FlatRecord const& record, std::string code, BuildOptions const& options) -> Category {
    auto classified = classify_name(record.name, options.depthMarker);

    Category category;
    category.code   = std::move(code);
    category.name   = std::move(classified.displayName);
    category.depth  = classified.depth;
    category.weight = parse_lenient_double(record.weight, options.decimalComma);
    for (auto const period : kPeriods) {
        auto const slot              = periodSlot(period);
        category.indexValues[slot] = parse_lenient_double(record.indices[slot], options.decimalComma);
    }
    category.variation = computeVariation(category.indexValues);
    return category;
}

} // namespace

TreeBuilder::TreeBuilder(BuildOptions options)
    : options_(std::move(options)) {}

auto TreeBuilder::buildRaw(std::span<FlatRecord const> records) -> CategoryTree {
    report_ = BuildReport{};

    std::vector<std::shared_ptr<Category>>      nodes;
    phmap::flat_hash_map<std::string, std::size_t> slotByCode;
    nodes.reserve(records.size());
    slotByCode.reserve(records.size());

    for (auto const& record : records) {
        ++report_.recordsSeen;
        if (is_total_sentinel(record.code, options_.totalLabels)) {
            ++report_.skippedTotals;
            continue;
        }

        std::string code{trim_ascii(record.code)};
        if (code == CategoryTree::kRootCode) {
            ++report_.skippedTotals;
            pt_log("Record uses the reserved root code; skipped", "TreeBuilder", "WARN");
            continue;
        }
        if (!is_valid_code(code)) {
            ++report_.nonNumericCodes;
            pt_log("Code '" + code + "': " + std::string{code_validation_message(validate_code_impl(code).code)},
                   "TreeBuilder", "WARN");
        }

        auto category = makeCategory(record, code, options_);
        if (auto it = slotByCode.find(code); it != slotByCode.end()) {
            ++report_.duplicateCodes;
            pt_log("Duplicate code " + code + " replaces the earlier record", "TreeBuilder", "WARN");
            *nodes[it->second] = std::move(category);
            continue;
        }
        slotByCode.emplace(std::move(code), nodes.size());
        nodes.push_back(std::make_shared<Category>(std::move(category)));
    }

    auto root  = std::make_shared<Category>();
    root->code = std::string{CategoryTree::kRootCode};
    root->name = std::string{CategoryTree::kRootName};

    for (auto const& node : nodes) {
        auto const parent = parent_code(node->code);
        auto       it     = parent.empty() ? slotByCode.end() : slotByCode.find(std::string{parent});
        if (it != slotByCode.end()) {
            nodes[it->second]->children.push_back(node);
            continue;
        }
        if (!parent.empty()) {
            ++report_.attachedToRoot;
            pt_log("Parent " + std::string{parent} + " of " + node->code + " is missing; attaching under root",
                   "TreeBuilder", "INFO");
        }
        root->children.push_back(node);
    }
    root->weight = root->childWeightSum();

    report_.categories = nodes.size();
    pt_log("Built " + std::to_string(nodes.size()) + " categories from " + std::to_string(report_.recordsSeen)
                   + " records",
           "TreeBuilder", "INFO");
    return CategoryTree{std::move(root), 0};
}

auto TreeBuilder::build(std::span<FlatRecord const> records) -> CategoryTree {
    return aggregate(buildRaw(records));
}

auto buildRawTree(std::span<FlatRecord const> records, BuildOptions const& options) -> CategoryTree {
    TreeBuilder builder{options};
    return builder.buildRaw(records);
}

auto buildTree(std::span<FlatRecord const> records, BuildOptions const& options) -> CategoryTree {
    TreeBuilder builder{options};
    return builder.build(records);
}

} // namespace PT
