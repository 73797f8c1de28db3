#pragma once
#include "core/Category.hpp"
#include "ingest/FlatRecord.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace PT {

struct BuildOptions {
    std::string              depthMarker{"__"};
    std::vector<std::string> totalLabels{"total"}; // besides empty and numeric zero codes
    bool                     decimalComma = false;
};

struct BuildReport {
    std::size_t recordsSeen     = 0;
    std::size_t categories      = 0;
    std::size_t skippedTotals   = 0; // empty, zero, total-labelled or reserved codes
    std::size_t duplicateCodes  = 0;
    std::size_t attachedToRoot  = 0; // codes with a parent code that is not in the table
    std::size_t nonNumericCodes = 0;
};

/**
 * Turns flat records into a rooted category tree.
 *
 * Every record becomes a node whose variation is computed from its own
 * readings. Attachment happens after all records are read, so order in the
 * source does not matter for parenting; it only fixes sibling order. A code
 * whose structural parent is missing hangs directly under the synthetic
 * root. When a code repeats, the later record's values win and the node
 * keeps the position of the first occurrence.
 */
class TreeBuilder {
public:
    explicit TreeBuilder(BuildOptions options = {});

    // Tree with raw readings only; inner nodes are not aggregated yet.
    [[nodiscard]] auto buildRaw(std::span<FlatRecord const> records) -> CategoryTree;

    // buildRaw followed by the aggregation pass.
    [[nodiscard]] auto build(std::span<FlatRecord const> records) -> CategoryTree;

    [[nodiscard]] auto lastReport() const noexcept -> BuildReport const& {
        return report_;
    }

    [[nodiscard]] auto options() const noexcept -> BuildOptions const& {
        return options_;
    }

private:
    BuildOptions options_;
    BuildReport  report_;
};

[[nodiscard]] auto buildRawTree(std::span<FlatRecord const> records, BuildOptions const& options = {}) -> CategoryTree;
[[nodiscard]] auto buildTree(std::span<FlatRecord const> records, BuildOptions const& options = {}) -> CategoryTree;

} // namespace PT
