#pragma once
#include "core/Category.hpp"
#include "core/Error.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

namespace PT {

struct EditRecord {
    std::string code;
    double      previousWeight = 0.0;
    double      newWeight      = 0.0;
};

struct SessionCounts {
    std::size_t edits = 0; // successful edits applied, undone ones included
    std::size_t undo  = 0;
    std::size_t redo  = 0;
};

/**
 * Holder of the "current tree" between edits.
 *
 * Each successful edit replaces the current snapshot with the rebalanced one
 * and keeps the previous snapshot on the undo stack; a failed edit leaves
 * everything as it was. Snapshots share structure, so history costs only
 * the nodes each edit copied. Not thread safe: edits must be serialized by
 * the owner.
 */
class EditSession {
public:
    static constexpr std::size_t kDefaultMaxHistory = 64;

    explicit EditSession(CategoryTree initial, std::size_t maxHistory = kDefaultMaxHistory);

    [[nodiscard]] auto current() const noexcept -> CategoryTree const& {
        return current_;
    }

    auto applyWeight(std::string_view code, double newWeight) -> Expected<EditRecord>;
    auto undo() -> Expected<void>;
    auto redo() -> Expected<void>;

    [[nodiscard]] auto canUndo() const noexcept -> bool {
        return !undo_.empty();
    }
    [[nodiscard]] auto canRedo() const noexcept -> bool {
        return !redo_.empty();
    }
    [[nodiscard]] auto counts() const noexcept -> SessionCounts;
    [[nodiscard]] auto editCount() const noexcept -> std::size_t {
        return edits_;
    }
    [[nodiscard]] auto lastEdit() const noexcept -> EditRecord const* {
        return undo_.empty() ? nullptr : &undo_.back().edit;
    }

private:
    struct Entry {
        CategoryTree snapshot; // tree before the edit
        EditRecord   edit;
    };

    CategoryTree      current_;
    std::deque<Entry> undo_;
    std::deque<Entry> redo_;
    std::size_t       maxHistory_;
    std::size_t       edits_ = 0;
};

} // namespace PT
