#include "rhythmlink/edit/EditHistory.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace rhythmlink::edit {

EditHistory::EditHistory() = default;

bool EditHistory::record(EditBatch batch) {
    if (batch.tasks.empty()) {
        return false;
    }

    // If we're in a group, merge into the group for undo purposes
    if (currentGroup_) {
        std::move(batch.tasks.begin(), batch.tasks.end(), std::back_inserter(currentGroup_->tasks));
        return true;
    }

    push(std::move(batch));
    return true;
}

bool EditHistory::canUndo() const {
    return currentIndex_ > 0;
}

bool EditHistory::canRedo() const {
    return currentIndex_ < history_.size();
}

std::optional<EditBatch> EditHistory::undo() {
    if (!canUndo()) {
        return std::nullopt;
    }

    --currentIndex_;
    return history_[currentIndex_];
}

std::optional<EditBatch> EditHistory::redo() {
    if (!canRedo()) {
        return std::nullopt;
    }

    return history_[currentIndex_++];
}

std::optional<std::string> EditHistory::undoDescription() const {
    if (!canUndo()) {
        return std::nullopt;
    }
    return history_[currentIndex_ - 1].description;
}

std::optional<std::string> EditHistory::redoDescription() const {
    if (!canRedo()) {
        return std::nullopt;
    }
    return history_[currentIndex_].description;
}

void EditHistory::beginGroup(std::string description) {
    if (currentGroup_) {
        // Nested groups not supported - end the current one first
        endGroup();
    }

    currentGroup_ = EditBatch{.description = std::move(description), .tasks = {}};
}

void EditHistory::endGroup() {
    if (!currentGroup_) {
        return;
    }

    // Only add non-empty groups to history
    if (!currentGroup_->tasks.empty()) {
        push(std::move(*currentGroup_));
    }

    currentGroup_.reset();
}

void EditHistory::clear() {
    history_.clear();
    currentIndex_ = 0;
    currentGroup_.reset();
}

size_t EditHistory::redoStackSize() const {
    return history_.size() - currentIndex_;
}

void EditHistory::push(EditBatch batch) {
    // A new batch invalidates redo
    clearRedoStack();

    history_.push_back(std::move(batch));
    currentIndex_ = history_.size();

    trimHistory();
}

void EditHistory::trimHistory() {
    if (history_.size() <= maxHistorySize_) {
        return;
    }

    // Remove oldest batches
    size_t toRemove = history_.size() - maxHistorySize_;
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(toRemove));
    currentIndex_ = std::min(currentIndex_, history_.size());
}

void EditHistory::clearRedoStack() {
    if (currentIndex_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(currentIndex_), history_.end());
    }
}

}  // namespace rhythmlink::edit
