#include "rebalance/WeightRebalancer.hpp"

#include "aggregate/IndexFormula.hpp"
#include "log/TaggedLogger.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace PT {

namespace {

auto applyTargetWeight(Category const& target, double newWeight) -> CategoryPtr {
    auto updated = cloneCategory(target);
    if (updated->isLeaf()) {
        updated->weight = newWeight;
        return updated;
    }

    auto const totalChildWeight = updated->childWeightSum();
    if (totalChildWeight > 0.0) {
        auto const scale = newWeight / totalChildWeight;
        for (auto& child : updated->children) {
            child = scaleSubtreeWeights(child, scale);
        }
    } else {
        pt_log("Children of " + updated->code + " weigh nothing; descendants left unscaled", "WeightRebalancer",
               "WARN");
    }

    refreshFromChildren(*updated);
    updated->weight = newWeight;
    return updated;
}

// Rebuilds ancestor with replacement standing in for previous among its children.
auto rebuildAncestor(Category const& ancestor, CategoryPtr const& previous, CategoryPtr replacement) -> CategoryPtr {
    auto updated = cloneCategory(ancestor);
    for (auto& child : updated->children) {
        if (child == previous) {
            child = std::move(replacement);
            break;
        }
    }
    updated->weight = updated->childWeightSum();
    refreshFromChildren(*updated);
    return updated;
}

} // namespace

auto scaleSubtreeWeights(CategoryPtr const& node, double scale) -> CategoryPtr {
    if (!node || scale == 1.0) {
        return node;
    }
    auto updated = cloneCategory(*node);
    updated->weight *= scale;
    for (auto& child : updated->children) {
        child = scaleSubtreeWeights(child, scale);
    }
    return updated;
}

auto rebalance(CategoryTree const& tree, std::string_view code, double newWeight) -> Expected<CategoryTree> {
    if (!std::isfinite(newWeight) || newWeight < 0.0) {
        return std::unexpected(Error{Error::Code::InvalidWeight, "weight must be a finite value >= 0"});
    }

    auto const path = tree.pathTo(code);
    if (path.empty()) {
        return std::unexpected(Error{Error::Code::NotFound, "no category with code " + std::string{code}});
    }

    pt_log("Setting weight of " + std::string{code} + " to " + std::to_string(newWeight), "WeightRebalancer", "INFO");

    auto updated = applyTargetWeight(*path.back(), newWeight);
    for (std::size_t i = path.size() - 1; i > 0; --i) {
        updated = rebuildAncestor(*path[i - 1], path[i], std::move(updated));
    }
    return CategoryTree{std::move(updated), tree.generation() + 1};
}

} // namespace PT
