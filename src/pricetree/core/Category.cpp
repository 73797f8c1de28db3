#include "Category.hpp"

#include <utility>

namespace PT {

namespace {

auto collectPath(CategoryPtr const& node, std::string_view code, std::vector<CategoryPtr>& path) -> bool {
    path.push_back(node);
    if (node->code == code) {
        return true;
    }
    for (auto const& child : node->children) {
        if (child && collectPath(child, code, path)) {
            return true;
        }
    }
    path.pop_back();
    return false;
}

void visitNode(Category const& node, std::size_t level, CategoryTree::Visitor const& visitor) {
    visitor(node, level);
    for (auto const& child : node.children) {
        if (child) {
            visitNode(*child, level + 1, visitor);
        }
    }
}

} // namespace

auto Category::childWeightSum() const noexcept -> double {
    double sum = 0.0;
    for (auto const& child : children) {
        sum += child->weight;
    }
    return sum;
}

auto cloneCategory(Category const& node) -> std::shared_ptr<Category> {
    return std::make_shared<Category>(node);
}

CategoryTree::CategoryTree(CategoryPtr root, std::size_t generation)
    : root_(std::move(root)), generation_(generation) {}

auto CategoryTree::find(std::string_view code) const -> CategoryPtr {
    auto path = pathTo(code);
    if (path.empty()) {
        return {};
    }
    return path.back();
}

auto CategoryTree::pathTo(std::string_view code) const -> std::vector<CategoryPtr> {
    std::vector<CategoryPtr> path;
    if (root_) {
        collectPath(root_, code, path);
    }
    return path;
}

auto CategoryTree::nodeCount() const -> std::size_t {
    std::size_t count = 0;
    visit([&count](Category const&, std::size_t) { ++count; });
    return count;
}

void CategoryTree::visit(Visitor const& visitor) const {
    if (root_) {
        visitNode(*root_, 0, visitor);
    }
}

} // namespace PT
