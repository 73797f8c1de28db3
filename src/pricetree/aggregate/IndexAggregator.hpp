#pragma once
#include "core/Category.hpp"

namespace PT {

/**
 * Bottom-up pass computing every inner node's index values and variation as
 * weighted means of its children. Each inner node's weight becomes the sum
 * of its children's weights unless that sum is zero. Leaves are shared with
 * the input tree unchanged; the input tree itself is never modified.
 */
[[nodiscard]] auto aggregate(CategoryTree const& tree) -> CategoryTree;

[[nodiscard]] auto aggregateSubtree(CategoryPtr const& node) -> CategoryPtr;

} // namespace PT
