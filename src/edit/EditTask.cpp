#include "rhythmlink/edit/EditTask.hpp"

namespace rhythmlink::edit {

int batchSystem(const EditBatch& batch) {
    for (const auto& task : batch.tasks) {
        if (const auto* entityTask = std::get_if<EntityTask>(&task); entityTask != nullptr) {
            if (entityTask->systemIndex >= 0) {
                return entityTask->systemIndex;
            }
        } else if (const auto* relationTask = std::get_if<RelationTask>(&task); relationTask != nullptr) {
            if (relationTask->systemIndex >= 0) {
                return relationTask->systemIndex;
            }
        } else if (const auto* mergeTask = std::get_if<SystemMergeTask>(&task); mergeTask != nullptr) {
            if (mergeTask->systemIndex >= 0) {
                return mergeTask->systemIndex;
            }
        }
    }
    return -1;
}

const char* toString(OpKind opKind) {
    switch (opKind) {
    case OpKind::Do:
        return "DO";
    case OpKind::Undo:
        return "UNDO";
    case OpKind::Redo:
        return "REDO";
    }
    return "?";
}

const char* toString(EntityKind kind) {
    switch (kind) {
    case EntityKind::AugmentationDot:
        return "AugmentationDot";
    case EntityKind::Barline:
        return "Barline";
    case EntityKind::BeamHook:
        return "BeamHook";
    case EntityKind::Beam:
        return "Beam";
    case EntityKind::Flag:
        return "Flag";
    case EntityKind::HeadChord:
        return "HeadChord";
    case EntityKind::Head:
        return "Head";
    case EntityKind::RestChord:
        return "RestChord";
    case EntityKind::Rest:
        return "Rest";
    case EntityKind::SmallBeam:
        return "SmallBeam";
    case EntityKind::SmallChord:
        return "SmallChord";
    case EntityKind::SmallFlag:
        return "SmallFlag";
    case EntityKind::StaffBarline:
        return "StaffBarline";
    case EntityKind::Stem:
        return "Stem";
    case EntityKind::Tuplet:
        return "Tuplet";
    case EntityKind::MeasureStack:
        return "MeasureStack";
    case EntityKind::TimeSignature:
        return "TimeSignature";
    case EntityKind::TimeNumber:
        return "TimeNumber";
    case EntityKind::Brace:
        return "Brace";
    case EntityKind::Slur:
        return "Slur";
    case EntityKind::Clef:
        return "Clef";
    case EntityKind::KeySignature:
        return "KeySignature";
    case EntityKind::Articulation:
        return "Articulation";
    case EntityKind::Dynamics:
        return "Dynamics";
    case EntityKind::Fermata:
        return "Fermata";
    case EntityKind::Ornament:
        return "Ornament";
    case EntityKind::Text:
        return "Text";
    case EntityKind::Lyric:
        return "Lyric";
    }
    return "?";
}

const char* toString(RelationKind kind) {
    switch (kind) {
    case RelationKind::Augmentation:
        return "Augmentation";
    case RelationKind::BeamStem:
        return "BeamStem";
    case RelationKind::ChordTuplet:
        return "ChordTuplet";
    case RelationKind::DoubleDot:
        return "DoubleDot";
    case RelationKind::HeadStem:
        return "HeadStem";
    case RelationKind::SameTime:
        return "SameTime";
    case RelationKind::SameVoice:
        return "SameVoice";
    case RelationKind::SeparateTime:
        return "SeparateTime";
    case RelationKind::SeparateVoice:
        return "SeparateVoice";
    case RelationKind::SlurHead:
        return "SlurHead";
    case RelationKind::ChordArticulation:
        return "ChordArticulation";
    case RelationKind::ChordDynamics:
        return "ChordDynamics";
    case RelationKind::LyricChord:
        return "LyricChord";
    }
    return "?";
}

}  // namespace rhythmlink::edit
