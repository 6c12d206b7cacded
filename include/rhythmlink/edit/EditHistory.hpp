#pragma once

#include "rhythmlink/edit/EditTask.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rhythmlink::edit {

/// Undo/redo history of edit batches. The document changes themselves are applied by
/// the editor; the history replays the batches so that their impact can be recomputed.
class EditHistory {
public:
    EditHistory();

    /// Record a batch that has just been applied
    bool record(EditBatch batch);

    /// Undo/redo operations, returning the batch to replay
    [[nodiscard]] bool canUndo() const;
    [[nodiscard]] bool canRedo() const;
    std::optional<EditBatch> undo();
    std::optional<EditBatch> redo();

    /// Get descriptions for UI (tooltips, menu items)
    [[nodiscard]] std::optional<std::string> undoDescription() const;
    [[nodiscard]] std::optional<std::string> redoDescription() const;

    /// Transaction support for grouping batches into one undo step
    void beginGroup(std::string description);
    void endGroup();
    [[nodiscard]] bool isInGroup() const { return currentGroup_.has_value(); }

    /// Clear all history (called on document change)
    void clear();

    void setMaxHistorySize(size_t size) { maxHistorySize_ = size; }
    [[nodiscard]] size_t maxHistorySize() const { return maxHistorySize_; }

    [[nodiscard]] size_t undoStackSize() const { return currentIndex_; }
    [[nodiscard]] size_t redoStackSize() const;

private:
    void push(EditBatch batch);
    void trimHistory();
    void clearRedoStack();

    std::vector<EditBatch> history_;
    size_t currentIndex_ = 0;  // Points to next undo position
    size_t maxHistorySize_ = 100;

    std::optional<EditBatch> currentGroup_;
};

}  // namespace rhythmlink::edit
