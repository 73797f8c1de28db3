#pragma once
#include "core/Category.hpp"
#include "core/Error.hpp"

#include <cstddef>

namespace PT {

struct MemoryStats {
    std::size_t uniqueNodes = 0;
    std::size_t leafNodes   = 0;
};

struct DeltaStats {
    std::size_t newNodes     = 0;
    std::size_t reusedNodes  = 0;
    std::size_t removedNodes = 0;
};

[[nodiscard]] auto analyze(CategoryTree const& tree) -> MemoryStats;

// Node identity comparison between two snapshots: how much of updated is
// physically shared with baseline.
[[nodiscard]] auto analyzeDelta(CategoryTree const& baseline, CategoryTree const& updated) -> DeltaStats;

/**
 * Checks the structural and numeric invariants of a snapshot: unique codes,
 * non-root nodes hanging under their structural parent when that parent
 * exists, non-negative weights, inner node weight equal to the sum of its
 * children, and variation matching the node's index values. Reports the first violation found.
 */
[[nodiscard]] auto validateTree(CategoryTree const& tree, double tolerance = 1e-9) -> Expected<void>;

// Same shape, codes, names, depths, and numbers within tolerance.
[[nodiscard]] auto equivalentTrees(CategoryTree const& a, CategoryTree const& b, double tolerance = 1e-9) -> bool;

} // namespace PT
