#pragma once

#include "rhythmlink/edit/EditHistory.hpp"
#include "rhythmlink/rhythm/RhythmRecompute.hpp"
#include "rhythmlink/score/Score.hpp"

#include <optional>
#include <vector>

namespace rhythmlink::rhythm {

/// Keeps the rhythm of a score in step with the edits made to it.
/// Each call is made once the editor has changed the document accordingly.
class RhythmSession {
public:
    RhythmSession(score::Score& score, RhythmBuilder& builder, RhythmConfig config = {});

    /// Record a freshly applied batch and recompute what it impacts.
    RhythmImpact apply(edit::EditBatch batch);

    /// Replay the last batch backwards. Returns nullopt when there is nothing to undo.
    std::optional<RhythmImpact> undo();
    std::optional<RhythmImpact> redo();

    /// Connect voices across page breaks with the configured cross-slur linker.
    int refineScore(const std::vector<int>& selectedPages = {});

    edit::EditHistory& history() { return history_; }
    [[nodiscard]] const edit::EditHistory& history() const { return history_; }

private:
    RhythmImpact replay(const edit::EditBatch& batch, edit::OpKind opKind);

    score::Score& score_;
    RhythmRecomputeDriver driver_;
    edit::EditHistory history_;
};

}  // namespace rhythmlink::rhythm
