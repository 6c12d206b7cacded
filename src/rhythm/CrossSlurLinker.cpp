#include "rhythmlink/rhythm/CrossSlurLinker.hpp"

#include "rhythmlink/common/Logger.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <unordered_set>

namespace rhythmlink::rhythm {
namespace {

struct OrphanEnd {
    int slurIndex = -1;
    int ordinate = 0;  // relative to the part top line
    int pitch = 0;
};

std::optional<OrphanEnd> orphanEnd(const score::Score& score, int slurIndex, score::HorizontalSide headSide) {
    const score::Slur* slur = score.slur(slurIndex);
    const score::Note* head = score.note(score.slurHead(slurIndex, headSide));
    const score::Part* part = slur == nullptr ? nullptr : score.part(slur->partIndex);
    if (head == nullptr || part == nullptr) {
        return std::nullopt;
    }
    return OrphanEnd{.slurIndex = slurIndex, .ordinate = head->center.y - part->top, .pitch = head->pitch};
}

}  // namespace

OrdinateCrossSlurLinker::OrdinateCrossSlurLinker(int maxOrdinateDelta, int maxPitchDelta)
    : maxOrdinateDelta_(maxOrdinateDelta), maxPitchDelta_(maxPitchDelta) {}

CrossSlurLinks OrdinateCrossSlurLinker::link(const score::Score& score, int partIndex, int precedingPartIndex) const {
    CrossSlurLinks links;

    std::vector<OrphanEnd> endings;
    const auto precedingOrphans =
        score.partSlurs(precedingPartIndex, [&](const score::Slur& slur) { return score.isEndingOrphan(slur.index); });
    for (const int slurIndex : precedingOrphans) {
        // An ending orphan still holds its left head.
        if (const auto end = orphanEnd(score, slurIndex, score::HorizontalSide::Left); end.has_value()) {
            endings.push_back(*end);
        }
    }

    std::unordered_set<int> used;
    const auto orphans =
        score.partSlurs(partIndex, [&](const score::Slur& slur) { return score.isBeginningOrphan(slur.index); });
    for (const int slurIndex : orphans) {
        const auto begin = orphanEnd(score, slurIndex, score::HorizontalSide::Right);
        if (!begin.has_value()) {
            continue;
        }

        const OrphanEnd* best = nullptr;
        int bestDelta = 0;
        for (const auto& candidate : endings) {
            if (used.contains(candidate.slurIndex)) {
                continue;
            }
            const int dy = std::abs(candidate.ordinate - begin->ordinate);
            const int dp = std::abs(candidate.pitch - begin->pitch);
            if (dy > maxOrdinateDelta_ || dp > maxPitchDelta_) {
                continue;
            }
            if (best == nullptr || dy < bestDelta) {
                best = &candidate;
                bestDelta = dy;
            }
        }

        if (best != nullptr) {
            used.insert(best->slurIndex);
            links.emplace(slurIndex, best->slurIndex);
        }
    }

    return links;
}

bool checkCrossTie(score::Score& score, int slurIndex, int precedingSlurIndex) {
    score::Slur* slur = score.slur(slurIndex);
    score::Slur* preceding = score.slur(precedingSlurIndex);
    if (slur == nullptr || preceding == nullptr) {
        return false;
    }

    const score::Note* right = score.note(slur->rightHead);
    const score::Note* left = score.note(preceding->leftHead);
    if (right == nullptr || left == nullptr) {
        return false;
    }

    const bool flagged = slur->isTie && preceding->isTie;
    if (!flagged && right->pitch != left->pitch) {
        return false;
    }

    slur->isTie = true;
    preceding->isTie = true;
    slur->crossTieConfirmed = true;
    preceding->crossTieConfirmed = true;
    common::Logger::logDebug("Cross-page tie slur#" + std::to_string(precedingSlurIndex) + " -> slur#" +
                             std::to_string(slurIndex));
    return true;
}

void discardOrphans(score::Score& score, const std::vector<int>& slurs, score::HorizontalSide side) {
    for (const int slurIndex : slurs) {
        score::Slur* slur = score.slur(slurIndex);
        if (slur == nullptr || slur->discarded) {
            continue;
        }
        if (score.slurHead(slurIndex, side) >= 0 || score.slurExtension(slurIndex, side) >= 0) {
            continue;
        }
        slur->discarded = true;
        common::Logger::logDebug("Discarded orphan slur#" + std::to_string(slurIndex));
    }
}

}  // namespace rhythmlink::rhythm
