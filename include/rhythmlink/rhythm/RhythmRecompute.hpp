#pragma once

#include "rhythmlink/rhythm/CrossSlurLinker.hpp"
#include "rhythmlink/rhythm/RhythmConfig.hpp"
#include "rhythmlink/rhythm/RhythmImpact.hpp"
#include "rhythmlink/score/Score.hpp"

namespace rhythmlink::rhythm {

/// Upstream producer deriving chords slots and voices of one measure stack.
/// Called on a stack whose rhythm has just been reset.
class RhythmBuilder {
public:
    virtual ~RhythmBuilder() = default;

    virtual void buildStack(score::Score& score, int stackIndex) = 0;

protected:
    RhythmBuilder() = default;
};

/// Re-runs the rhythm pipeline at the smallest granularity an impact allows.
class RhythmRecomputeDriver {
public:
    RhythmRecomputeDriver(RhythmBuilder& builder, RhythmConfig config = {});

    /// Rebuild every stack of the page, then link voices across measures, systems and the
    /// page breaks around it.
    void processPage(score::Score& score, int pageIndex);

    /// Rebuild one stack and re-link it with its previous and next siblings.
    void reprocessStack(score::Score& score, int stackIndex);

    /// Link the page with the page before it, then follow the change onto the next pages
    /// while their voice IDs keep moving. Returns the count of modifications made.
    int relinkPageBreaks(score::Score& score, int pageIndex);

    void apply(score::Score& score, const RhythmImpact& impact);

    [[nodiscard]] const RhythmConfig& config() const { return config_; }
    [[nodiscard]] const CrossSlurLinker& linker() const { return linker_; }

private:
    void rebuildStack(score::Score& score, int stackIndex);

    RhythmBuilder& builder_;
    RhythmConfig config_;
    OrdinateCrossSlurLinker linker_;
};

}  // namespace rhythmlink::rhythm
