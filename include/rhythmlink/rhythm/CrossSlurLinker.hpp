#pragma once

#include "rhythmlink/rhythm/SlurAdapter.hpp"
#include "rhythmlink/score/Score.hpp"

namespace rhythmlink::rhythm {

/// Matches the slurs ending a part on one page with the slurs beginning the same logical
/// part on the next page. The mapping must be injective.
class CrossSlurLinker {
public:
    virtual ~CrossSlurLinker() = default;

    /// Links from beginning orphans of `partIndex` to ending orphans of `precedingPartIndex`.
    [[nodiscard]] virtual CrossSlurLinks link(const score::Score& score, int partIndex,
                                              int precedingPartIndex) const = 0;

protected:
    CrossSlurLinker() = default;
};

/// Default linker: pairs orphans whose heads sit at the same staff-relative ordinate and pitch,
/// nearest first, within the given tolerances.
class OrdinateCrossSlurLinker final : public CrossSlurLinker {
public:
    OrdinateCrossSlurLinker(int maxOrdinateDelta, int maxPitchDelta);

    [[nodiscard]] CrossSlurLinks link(const score::Score& score, int partIndex,
                                      int precedingPartIndex) const override;

private:
    int maxOrdinateDelta_;
    int maxPitchDelta_;
};

/// Mark the pair as a tie when both pieces are flagged tie or their heads share a pitch.
/// Returns true when the pair is a confirmed cross-page tie.
bool checkCrossTie(score::Score& score, int slurIndex, int precedingSlurIndex);

/// Discard orphan slurs that found no partner on the given side.
void discardOrphans(score::Score& score, const std::vector<int>& slurs, score::HorizontalSide side);

}  // namespace rhythmlink::rhythm
