#pragma once

#include "rhythmlink/rhythm/CrossSlurLinker.hpp"
#include "rhythmlink/rhythm/SlurAdapter.hpp"
#include "rhythmlink/score/Score.hpp"

#include <optional>
#include <vector>

namespace rhythmlink::rhythm {

/// Voice ID imposed on the voice by a tie arriving on a head of its first chord, if any.
/// The adapter provides the partnering slur at the preceding location.
std::optional<int> tiedVoiceId(const score::Score& score, int voiceIndex, const SlurAdapter& adapter);

/// Rename voices of each measure of the stack from top to bottom, then extend each chord
/// voice to its cue chords. Not part of the default pipeline.
void refineStack(score::Score& score, int stackIndex);

/// Link the voices of one measure to the measure preceding it in the same part, using ties,
/// same-voice annotations and preferred voice IDs. Returns the number of swaps.
int refineMeasure(score::Score& score, int measureIndex, int previousMeasureIndex);

/// Connect voices within the same part across all measures of a system.
int refineSystem(score::Score& score, int systemIndex);

/// Re-link a single stack with its previous and next siblings, leaving other stacks alone.
/// The first stack of a system is also tied to the preceding system, or to the preceding
/// page through `linker` when one is given.
int refineStackBoundaries(score::Score& score, int stackIndex, const CrossSlurLinker* linker = nullptr);

/// Connect voices within the same logical part across all systems of a page.
int refinePage(score::Score& score, int pageIndex);

/// Connect voices within the same logical part across all pages of the score.
/// Ties across pages are not persisted, they are detected here through the linker.
/// `selectedPages` restricts processing; empty means every page.
/// Returns the count of modifications made.
int refineScore(score::Score& score, const CrossSlurLinker& linker, const std::vector<int>& selectedPages = {});

}  // namespace rhythmlink::rhythm
