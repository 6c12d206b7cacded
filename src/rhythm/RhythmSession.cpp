#include "rhythmlink/rhythm/RhythmSession.hpp"

#include "rhythmlink/common/Logger.hpp"
#include "rhythmlink/rhythm/Voices.hpp"

#include <utility>

namespace rhythmlink::rhythm {

RhythmSession::RhythmSession(score::Score& score, RhythmBuilder& builder, RhythmConfig config)
    : score_(score),
      driver_(builder, std::move(config)) {}

RhythmImpact RhythmSession::apply(edit::EditBatch batch) {
    const RhythmImpact impact = replay(batch, edit::OpKind::Do);
    history_.record(std::move(batch));
    return impact;
}

std::optional<RhythmImpact> RhythmSession::undo() {
    const auto batch = history_.undo();
    if (!batch.has_value()) {
        return std::nullopt;
    }
    return replay(*batch, edit::OpKind::Undo);
}

std::optional<RhythmImpact> RhythmSession::redo() {
    const auto batch = history_.redo();
    if (!batch.has_value()) {
        return std::nullopt;
    }
    return replay(*batch, edit::OpKind::Redo);
}

int RhythmSession::refineScore(const std::vector<int>& selectedPages) {
    return rhythm::refineScore(score_, driver_.linker(), selectedPages);
}

RhythmImpact RhythmSession::replay(const edit::EditBatch& batch, edit::OpKind opKind) {
    const RhythmImpact impact = classifyImpact(score_, batch, opKind);
    if (impact.isEmpty()) {
        common::Logger::logDebug("No rhythm impact for " + batch.description);
        return impact;
    }

    driver_.apply(score_, impact);
    return impact;
}

}  // namespace rhythmlink::rhythm
