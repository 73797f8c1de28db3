#pragma once
#include "core/Category.hpp"
#include "core/Period.hpp"

#include <span>

namespace PT {

struct PeriodTotals {
    double weightedSum = 0.0;
    double validWeight = 0.0;
};

// Children whose value for the period is zero do not contribute at all.
[[nodiscard]] auto periodTotals(std::span<CategoryPtr const> children, Period period) -> PeriodTotals;

// Weighted mean of the contributing children, or prior when none contribute.
[[nodiscard]] auto weightedMean(std::span<CategoryPtr const> children, Period period, double prior) -> double;

[[nodiscard]] auto aggregateIndexValues(std::span<CategoryPtr const> children, IndexValues const& prior) -> IndexValues;

/**
 * Percent change of the newest reading against n-1 (monthly), n-3
 * (trimester) and n-12 (yearly). A zero reference leaves that field at 0.
 */
[[nodiscard]] auto computeVariation(IndexValues const& values) -> Variation;

// Recomputes node.indexValues and node.variation from node.children as they
// stand. Weights are not touched.
void refreshFromChildren(Category& node);

} // namespace PT
