#pragma once

#include "rhythmlink/score/Score.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rhythmlink::edit {

/// Kinds of score entities an edit can touch.
enum class EntityKind : uint8_t {
    AugmentationDot,
    Barline,
    BeamHook,
    Beam,
    Flag,
    HeadChord,
    Head,
    RestChord,
    Rest,
    SmallBeam,
    SmallChord,
    SmallFlag,
    StaffBarline,
    Stem,
    Tuplet,
    MeasureStack,
    TimeSignature,
    TimeNumber,
    Brace,
    Slur,
    Clef,
    KeySignature,
    Articulation,
    Dynamics,
    Fermata,
    Ornament,
    Text,
    Lyric,
};

inline constexpr std::array kAllEntityKinds = {
    EntityKind::AugmentationDot, EntityKind::Barline,      EntityKind::BeamHook,     EntityKind::Beam,
    EntityKind::Flag,            EntityKind::HeadChord,    EntityKind::Head,         EntityKind::RestChord,
    EntityKind::Rest,            EntityKind::SmallBeam,    EntityKind::SmallChord,   EntityKind::SmallFlag,
    EntityKind::StaffBarline,    EntityKind::Stem,         EntityKind::Tuplet,       EntityKind::MeasureStack,
    EntityKind::TimeSignature,   EntityKind::TimeNumber,   EntityKind::Brace,        EntityKind::Slur,
    EntityKind::Clef,            EntityKind::KeySignature, EntityKind::Articulation, EntityKind::Dynamics,
    EntityKind::Fermata,         EntityKind::Ornament,     EntityKind::Text,         EntityKind::Lyric,
};

/// Kinds of relations (edges between two entities) an edit can touch.
enum class RelationKind : uint8_t {
    Augmentation,
    BeamStem,
    ChordTuplet,
    DoubleDot,
    HeadStem,
    SameTime,
    SameVoice,
    SeparateTime,
    SeparateVoice,
    SlurHead,
    ChordArticulation,
    ChordDynamics,
    LyricChord,
};

inline constexpr std::array kAllRelationKinds = {
    RelationKind::Augmentation,      RelationKind::BeamStem,      RelationKind::ChordTuplet,
    RelationKind::DoubleDot,         RelationKind::HeadStem,      RelationKind::SameTime,
    RelationKind::SameVoice,         RelationKind::SeparateTime,  RelationKind::SeparateVoice,
    RelationKind::SlurHead,          RelationKind::ChordArticulation, RelationKind::ChordDynamics,
    RelationKind::LyricChord,
};

enum class TaskAction : uint8_t {
    Addition,
    Removal,
    Modification,
};

/// Direction in which a recorded batch is being played.
enum class OpKind : uint8_t {
    Do,
    Undo,
    Redo,
};

/// Edit of one entity located in a system.
struct EntityTask {
    TaskAction action = TaskAction::Modification;
    EntityKind kind = EntityKind::Head;
    int systemIndex = -1;
    std::optional<score::Point> center;
};

/// Edit of a relation between two entities of a system.
struct RelationTask {
    TaskAction action = TaskAction::Addition;
    RelationKind kind = RelationKind::SameVoice;
    int systemIndex = -1;
    std::optional<score::Point> sourceCenter;
    std::optional<score::Point> targetCenter;
};

/// Edit of a whole measure stack (insertion, merge of two stacks, ...).
struct StackTask {
    int stackIndex = -1;
};

/// Edit addressing a whole page.
struct PageTask {
    int pageIndex = -1;
};

/// Merge of a system with the following one.
struct SystemMergeTask {
    int systemIndex = -1;
};

using EditTask = std::variant<EntityTask, RelationTask, StackTask, PageTask, SystemMergeTask>;

struct EditBatch {
    std::string description;
    std::vector<EditTask> tasks;
};

/// System addressed by the first locatable task of the batch, or -1.
int batchSystem(const EditBatch& batch);

const char* toString(OpKind opKind);
const char* toString(EntityKind kind);
const char* toString(RelationKind kind);

}  // namespace rhythmlink::edit
