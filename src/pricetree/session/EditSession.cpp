#include "session/EditSession.hpp"

#include "log/TaggedLogger.hpp"
#include "rebalance/WeightRebalancer.hpp"

#include <utility>

namespace PT {

EditSession::EditSession(CategoryTree initial, std::size_t maxHistory)
    : current_(std::move(initial)), maxHistory_(maxHistory) {}

auto EditSession::applyWeight(std::string_view code, double newWeight) -> Expected<EditRecord> {
    auto target = current_.find(code);
    if (!target) {
        return std::unexpected(Error{Error::Code::NotFound, "no category with code " + std::string{code}});
    }
    auto next = rebalance(current_, code, newWeight);
    if (!next) {
        return std::unexpected(next.error());
    }

    EditRecord edit{std::string{code}, target->weight, newWeight};
    if (maxHistory_ > 0) {
        undo_.push_back(Entry{std::move(current_), edit});
        while (undo_.size() > maxHistory_) {
            undo_.pop_front();
        }
    }
    redo_.clear();
    current_ = std::move(*next);
    ++edits_;
    pt_log("Edit " + std::to_string(edits_) + " applied to " + edit.code, "EditSession", "INFO");
    return edit;
}

auto EditSession::undo() -> Expected<void> {
    if (undo_.empty()) {
        return std::unexpected(Error{Error::Code::NothingToUndo, "undo stack is empty"});
    }
    auto entry = std::move(undo_.back());
    undo_.pop_back();
    redo_.push_back(Entry{std::move(current_), entry.edit});
    current_ = std::move(entry.snapshot);
    return {};
}

auto EditSession::redo() -> Expected<void> {
    if (redo_.empty()) {
        return std::unexpected(Error{Error::Code::NothingToUndo, "redo stack is empty"});
    }
    auto entry = std::move(redo_.back());
    redo_.pop_back();
    undo_.push_back(Entry{std::move(current_), entry.edit});
    current_ = std::move(entry.snapshot);
    return {};
}

auto EditSession::counts() const noexcept -> SessionCounts {
    return SessionCounts{edits_, undo_.size(), redo_.size()};
}

} // namespace PT
