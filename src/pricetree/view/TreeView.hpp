#pragma once
#include "core/Category.hpp"
#include "core/Period.hpp"

#include <array>
#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace PT {

/**
 * Which categories are unfolded in an interactive view. Kept apart from the
 * snapshots so that edits, which replace the tree, keep the user's layout.
 */
class ExpansionState {
public:
    void toggle(std::string_view code);
    void expand(std::string_view code);
    void collapse(std::string_view code);
    void expandAll(CategoryTree const& tree);
    void collapseAll();

    [[nodiscard]] auto isExpanded(std::string_view code) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return expanded_.size();
    }

private:
    std::set<std::string, std::less<>> expanded_;
};

struct ViewRow {
    CategoryPtr category;
    std::size_t indent      = 0; // depth class * 2 + 1, as the table pads rows
    bool        expandable  = false;
    bool        expanded    = false;
};

// Pre-order rows currently visible: the root always, a node's children only
// while that node is expanded.
[[nodiscard]] auto visibleRows(CategoryTree const& tree, ExpansionState const& expansion) -> std::vector<ViewRow>;

// One decimal, negative zero printed as "0.0".
[[nodiscard]] auto formatOneDecimal(double value) -> std::string;

struct TableLabels {
    std::array<std::string, kPeriodCount> periods{"n-12", "n-3", "n-2", "n-1", "n"};
    std::string                           code{"Code"};
    std::string                           name{"Catégorie"};
    std::string                           weight{"Pondération"};
    std::string                           monthly{"var men %"};
    std::string                           trimester{"var trim %"};
    std::string                           yearly{"var ann %"};
};

[[nodiscard]] auto renderTable(std::vector<ViewRow> const& rows, TableLabels const& labels = {}) -> std::string;

} // namespace PT
