#include "aggregate/IndexAggregator.hpp"

#include "aggregate/IndexFormula.hpp"
#include "log/TaggedLogger.hpp"

#include <string>

namespace PT {

auto aggregateSubtree(CategoryPtr const& node) -> CategoryPtr {
    if (!node || node->isLeaf()) {
        return node;
    }

    auto updated = cloneCategory(*node);
    for (auto& child : updated->children) {
        child = aggregateSubtree(child);
    }

    updated->weight = updated->childWeightSum();
    if (updated->weight == 0.0) {
        pt_log("Children of " + updated->code + " carry no weight; keeping its own readings", "IndexAggregator",
               "WARN");
    }
    refreshFromChildren(*updated);
    return updated;
}

auto aggregate(CategoryTree const& tree) -> CategoryTree {
    if (!tree.valid()) {
        return tree;
    }
    return CategoryTree{aggregateSubtree(tree.root()), tree.generation() + 1};
}

} // namespace PT
