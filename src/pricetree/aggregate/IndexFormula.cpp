#include "aggregate/IndexFormula.hpp"

namespace PT {

namespace {

auto percentChange(double current, double reference) -> double {
    if (reference == 0.0) {
        return 0.0;
    }
    return (current - reference) / reference * 100.0;
}

} // namespace

auto periodTotals(std::span<CategoryPtr const> children, Period period) -> PeriodTotals {
    PeriodTotals totals;
    for (auto const& child : children) {
        auto const value = child->value(period);
        if (value != 0.0) {
            totals.weightedSum += value * child->weight;
            totals.validWeight += child->weight;
        }
    }
    return totals;
}

auto weightedMean(std::span<CategoryPtr const> children, Period period, double prior) -> double {
    auto const totals = periodTotals(children, period);
    if (totals.validWeight > 0.0) {
        return totals.weightedSum / totals.validWeight;
    }
    return prior;
}

auto aggregateIndexValues(std::span<CategoryPtr const> children, IndexValues const& prior) -> IndexValues {
    IndexValues result = prior;
    for (auto const period : kPeriods) {
        auto const slot = periodSlot(period);
        result[slot]    = weightedMean(children, period, prior[slot]);
    }
    return result;
}

auto computeVariation(IndexValues const& values) -> Variation {
    auto const current = values[periodSlot(Period::Current)];
    Variation  variation;
    variation.monthly   = percentChange(current, values[periodSlot(Period::PreviousMonth)]);
    variation.trimester = percentChange(current, values[periodSlot(Period::ThreeMonthsAgo)]);
    variation.yearly    = percentChange(current, values[periodSlot(Period::YearAgo)]);
    return variation;
}

void refreshFromChildren(Category& node) {
    if (node.children.empty()) {
        return;
    }
    node.indexValues = aggregateIndexValues(node.children, node.indexValues);
    node.variation   = computeVariation(node.indexValues);
}

} // namespace PT
