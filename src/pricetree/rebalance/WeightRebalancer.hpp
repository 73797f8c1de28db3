#pragma once
#include "core/Category.hpp"
#include "core/Error.hpp"

#include <string_view>

namespace PT {

/**
 * Applies one weight edit and returns the resulting snapshot.
 *
 * When the edited node has children, every weight below it is multiplied by
 * newWeight / (sum of its direct children's weights), which keeps the
 * proportions between all descendants. If those children weigh nothing in
 * total the descendants are left alone. The node's own index values are then
 * recomputed from its children; the children's index values are not
 * recomputed, only weights travel downwards. Finally each ancestor up to the
 * root gets the sum of its children's weights and fresh weighted means.
 *
 * Only the nodes on the path from the root to the edited node and the
 * rescaled subtree are copied; everything else is shared with the input,
 * which stays valid and unchanged.
 *
 * Errors: InvalidWeight for a negative or non-finite weight, NotFound for a
 * code that is not in the tree. The input tree is unaffected in both cases.
 */
[[nodiscard]] auto rebalance(CategoryTree const& tree, std::string_view code, double newWeight)
        -> Expected<CategoryTree>;

// Every weight in the subtree multiplied by scale. A scale of exactly 1
// returns the node itself.
[[nodiscard]] auto scaleSubtreeWeights(CategoryPtr const& node, double scale) -> CategoryPtr;

} // namespace PT
