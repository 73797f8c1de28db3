#pragma once
#include "core/Period.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace PT {

struct Category;
using CategoryPtr = std::shared_ptr<const Category>;

/**
 * A node of the category hierarchy.
 *
 * Nodes are immutable once published in a CategoryTree. Edits clone the
 * nodes along the modified path and share every untouched subtree, so a
 * snapshot handed out earlier keeps reading the values it was built with.
 * Children are owned top-down only; a node's parent is derived from its
 * code, never stored.
 */
struct Category {
    std::string              code;
    std::string              name;
    double                   weight = 0.0;
    IndexValues              indexValues{};
    Variation                variation{};
    int                      depth = 0; // 0 or 1, from the name's nesting marker
    std::vector<CategoryPtr> children;

    [[nodiscard]] auto isLeaf() const noexcept -> bool {
        return children.empty();
    }

    [[nodiscard]] auto value(Period period) const noexcept -> double {
        return indexValues[periodSlot(period)];
    }

    [[nodiscard]] auto childWeightSum() const noexcept -> double;
};

// Shallow copy: the clone shares the original's children until they are
// replaced.
[[nodiscard]] auto cloneCategory(Category const& node) -> std::shared_ptr<Category>;

class CategoryTree {
public:
    static constexpr std::string_view kRootCode = "index0";
    static constexpr std::string_view kRootName = "Root Category";

    using Visitor = std::function<void(Category const&, std::size_t level)>;

    CategoryTree() = default;
    CategoryTree(CategoryPtr root, std::size_t generation);

    [[nodiscard]] auto root() const noexcept -> CategoryPtr const& {
        return root_;
    }
    [[nodiscard]] auto generation() const noexcept -> std::size_t {
        return generation_;
    }
    [[nodiscard]] auto valid() const noexcept -> bool {
        return static_cast<bool>(root_);
    }

    [[nodiscard]] auto find(std::string_view code) const -> CategoryPtr;

    // Chain of nodes from the root down to the node with the given code,
    // both ends included. Empty when the code is not in the tree.
    [[nodiscard]] auto pathTo(std::string_view code) const -> std::vector<CategoryPtr>;

    [[nodiscard]] auto nodeCount() const -> std::size_t;

    // Pre-order walk; level is the structural distance from the root.
    void visit(Visitor const& visitor) const;

private:
    CategoryPtr root_;
    std::size_t generation_ = 0;
};

} // namespace PT
