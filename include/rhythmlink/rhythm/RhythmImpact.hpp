#pragma once

#include "rhythmlink/edit/EditTask.hpp"
#include "rhythmlink/score/Score.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rhythmlink::rhythm {

enum class ImpactScope : uint8_t {
    None,
    Stack,  // timing effect stays within one measure stack
    Page,   // timing effect may ripple across the whole page
};

constexpr ImpactScope impactScopeOf(edit::EntityKind kind) {
    using edit::EntityKind;
    switch (kind) {
    case EntityKind::AugmentationDot:
    case EntityKind::Barline:
    case EntityKind::BeamHook:
    case EntityKind::Beam:
    case EntityKind::Flag:
    case EntityKind::HeadChord:
    case EntityKind::Head:
    case EntityKind::RestChord:
    case EntityKind::Rest:
    case EntityKind::SmallBeam:
    case EntityKind::SmallChord:
    case EntityKind::SmallFlag:
    case EntityKind::StaffBarline:
    case EntityKind::Stem:
    case EntityKind::Tuplet:
    case EntityKind::MeasureStack:
        return ImpactScope::Stack;
    case EntityKind::TimeSignature:
    case EntityKind::TimeNumber:
    case EntityKind::Brace:  // possible part merge or split
    case EntityKind::Slur:   // possible ties
        return ImpactScope::Page;
    case EntityKind::Clef:
    case EntityKind::KeySignature:
    case EntityKind::Articulation:
    case EntityKind::Dynamics:
    case EntityKind::Fermata:
    case EntityKind::Ornament:
    case EntityKind::Text:
    case EntityKind::Lyric:
        return ImpactScope::None;
    }
    return ImpactScope::None;
}

constexpr ImpactScope impactScopeOf(edit::RelationKind kind) {
    using edit::RelationKind;
    switch (kind) {
    case RelationKind::Augmentation:
    case RelationKind::BeamStem:
    case RelationKind::ChordTuplet:
    case RelationKind::DoubleDot:
    case RelationKind::HeadStem:
    case RelationKind::SameTime:
    case RelationKind::SameVoice:
    case RelationKind::SeparateTime:
    case RelationKind::SeparateVoice:
        return ImpactScope::Stack;
    case RelationKind::SlurHead:
    case RelationKind::ChordArticulation:
    case RelationKind::ChordDynamics:
    case RelationKind::LyricChord:
        return ImpactScope::None;
    }
    return ImpactScope::None;
}

constexpr bool isImpactingKind(edit::EntityKind kind) {
    return impactScopeOf(kind) != ImpactScope::None;
}

constexpr bool isImpactingKind(edit::RelationKind kind) {
    return impactScopeOf(kind) != ImpactScope::None;
}

/// What a batch of edits requires to be recomputed.
struct RhythmImpact {
    bool onPage = false;
    int pageIndex = -1;
    std::vector<int> stacks;  // insertion order, no duplicates

    void add(int stackIndex);
    [[nodiscard]] bool isEmpty() const { return !onPage && stacks.empty(); }
};

/// Classify a batch of edits played in the given direction.
RhythmImpact classifyImpact(const score::Score& score, const edit::EditBatch& batch, edit::OpKind opKind);

std::string describe(const RhythmImpact& impact);

}  // namespace rhythmlink::rhythm
