#include "snapshot/TreeStats.hpp"

#include "aggregate/IndexFormula.hpp"
#include "code/CategoryCode.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace PT {

namespace {

using NodeSet = phmap::flat_hash_set<Category const*>;

auto collect(CategoryPtr const& root) -> std::vector<CategoryPtr> {
    std::vector<CategoryPtr> nodes;
    if (!root) {
        return nodes;
    }
    NodeSet                  visited;
    std::vector<CategoryPtr> stack;
    stack.push_back(root);
    while (!stack.empty()) {
        CategoryPtr current = stack.back();
        stack.pop_back();
        auto raw = current.get();
        if (!raw || !visited.insert(raw).second) {
            continue;
        }
        nodes.push_back(current);
        for (auto const& child : current->children) {
            if (child) {
                stack.push_back(child);
            }
        }
    }
    return nodes;
}

auto nearlyEqual(double a, double b, double tolerance) -> bool {
    auto const scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= tolerance * scale;
}

auto violation(std::string const& code, std::string const& what) -> Error {
    return Error{Error::Code::InvariantViolation, code + ": " + what};
}

auto equivalentNodes(Category const& a, Category const& b, double tolerance) -> bool {
    if (a.code != b.code || a.name != b.name || a.depth != b.depth || a.children.size() != b.children.size()) {
        return false;
    }
    if (!nearlyEqual(a.weight, b.weight, tolerance)) {
        return false;
    }
    for (auto const period : kPeriods) {
        if (!nearlyEqual(a.value(period), b.value(period), tolerance)) {
            return false;
        }
    }
    if (!nearlyEqual(a.variation.monthly, b.variation.monthly, tolerance)
        || !nearlyEqual(a.variation.trimester, b.variation.trimester, tolerance)
        || !nearlyEqual(a.variation.yearly, b.variation.yearly, tolerance)) {
        return false;
    }
    for (std::size_t i = 0; i < a.children.size(); ++i) {
        if (a.children[i] == b.children[i]) {
            continue;
        }
        if (!a.children[i] || !b.children[i] || !equivalentNodes(*a.children[i], *b.children[i], tolerance)) {
            return false;
        }
    }
    return true;
}

} // namespace

auto analyze(CategoryTree const& tree) -> MemoryStats {
    MemoryStats stats;
    for (auto const& node : collect(tree.root())) {
        stats.uniqueNodes++;
        if (node->isLeaf()) {
            stats.leafNodes++;
        }
    }
    return stats;
}

auto analyzeDelta(CategoryTree const& baseline, CategoryTree const& updated) -> DeltaStats {
    DeltaStats stats;

    auto const baselineNodes = collect(baseline.root());
    auto const updatedNodes  = collect(updated.root());

    NodeSet baselineSet;
    baselineSet.reserve(baselineNodes.size());
    for (auto const& node : baselineNodes) {
        baselineSet.insert(node.get());
    }

    NodeSet updatedSet;
    updatedSet.reserve(updatedNodes.size());
    for (auto const& node : updatedNodes) {
        auto raw = node.get();
        updatedSet.insert(raw);
        if (baselineSet.contains(raw)) {
            stats.reusedNodes++;
        } else {
            stats.newNodes++;
        }
    }

    for (auto const& node : baselineNodes) {
        if (!updatedSet.contains(node.get())) {
            stats.removedNodes++;
        }
    }

    return stats;
}

auto validateTree(CategoryTree const& tree, double tolerance) -> Expected<void> {
    if (!tree.valid()) {
        return std::unexpected(Error{Error::Code::InvariantViolation, "snapshot has no root"});
    }

    phmap::flat_hash_map<std::string, std::string> parentOf;
    std::vector<Category const*>                   order;
    bool                                           duplicate = false;
    std::string                                    duplicateCode;

    tree.visit([&](Category const& node, std::size_t) {
        order.push_back(&node);
        for (auto const& child : node.children) {
            if (!parentOf.emplace(child->code, node.code).second && !duplicate) {
                duplicate     = true;
                duplicateCode = child->code;
            }
        }
    });
    if (duplicate || parentOf.contains(tree.root()->code)) {
        return std::unexpected(violation(duplicate ? duplicateCode : tree.root()->code, "code is not unique"));
    }

    for (auto const* node : order) {
        if (node != tree.root().get()) {
            auto const structural = std::string{parent_code(node->code)};
            auto const actual     = parentOf.at(node->code);
            if (!structural.empty() && parentOf.contains(structural)) {
                if (actual != structural) {
                    return std::unexpected(violation(node->code, "attached under " + actual + " instead of " + structural));
                }
            } else if (actual != tree.root()->code) {
                return std::unexpected(violation(node->code, "parent missing but not attached under root"));
            }
        }

        if (!(node->weight >= 0.0)) {
            return std::unexpected(violation(node->code, "negative weight"));
        }

        if (!node->isLeaf()) {
            auto const childWeight = node->childWeightSum();
            if (!nearlyEqual(node->weight, childWeight, tolerance)) {
                return std::unexpected(violation(node->code,
                                                 "weight " + std::to_string(node->weight)
                                                         + " differs from children total " + std::to_string(childWeight)));
            }
            for (auto const period : kPeriods) {
                auto const totals = periodTotals(node->children, period);
                if (totals.validWeight > 0.0
                    && !nearlyEqual(node->value(period), totals.weightedSum / totals.validWeight, tolerance)) {
                    return std::unexpected(violation(node->code,
                                                     "index " + std::string{periodTag(period)}
                                                             + " is not the weighted mean of its children"));
                }
            }
        }

        auto const expected = computeVariation(node->indexValues);
        if (!nearlyEqual(node->variation.monthly, expected.monthly, tolerance)
            || !nearlyEqual(node->variation.trimester, expected.trimester, tolerance)
            || !nearlyEqual(node->variation.yearly, expected.yearly, tolerance)) {
            return std::unexpected(violation(node->code, "variation does not match index values"));
        }
    }
    return {};
}

auto equivalentTrees(CategoryTree const& a, CategoryTree const& b, double tolerance) -> bool {
    if (a.root() == b.root()) {
        return true;
    }
    if (!a.root() || !b.root()) {
        return false;
    }
    return equivalentNodes(*a.root(), *b.root(), tolerance);
}

} // namespace PT
