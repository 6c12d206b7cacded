#include "rhythmlink/rhythm/Voices.hpp"

#include "rhythmlink/common/Logger.hpp"
#include "rhythmlink/rhythm/VoiceOrder.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace rhythmlink::rhythm {
namespace {

using common::Logger;

void logSwap(const score::Score& score, int voiceIndex, int newId, const char* reason) {
    if (!Logger::isDebugEnabled()) {
        return;
    }
    const score::Voice* voice = score.voice(voiceIndex);
    Logger::logDebug(std::string(reason) + ": measure#" + std::to_string(voice->measureIndex) + " voice " +
                     std::to_string(voice->id) + " -> " + std::to_string(newId));
}

/// Voice ID required by a same-voice annotation towards the previous measure, if any.
std::optional<int> sameVoiceId(const score::Score& score, int chordIndex, int previousMeasureIndex) {
    for (const int linkIndex : score.sameVoiceLinksOf(chordIndex)) {
        const score::Chord* other = score.chord(score.oppositeChord(linkIndex, chordIndex));
        if (other == nullptr || other->measureIndex != previousMeasureIndex) {
            continue;
        }

        const score::Voice* otherVoice = score.voice(other->voiceIndex);
        if (otherVoice == nullptr || otherVoice->measureIndex < 0) {
            return std::nullopt;
        }
        return otherVoice->id;
    }
    return std::nullopt;
}

void setCueVoices(score::Score& score, int measureIndex) {
    const score::Measure* measure = score.measure(measureIndex);
    for (const int chordIndex : measure->chords) {
        const score::Chord* cue = score.chord(chordIndex);
        if (!cue->isCue) {
            continue;
        }
        const score::Chord* principal = score.chord(cue->principalChordIndex);
        if (principal == nullptr || principal->voiceIndex < 0 || principal->voiceIndex == cue->voiceIndex) {
            continue;
        }
        score.assignChordToVoice(chordIndex, principal->voiceIndex);
    }
}

/// Measure-local counterpart of the part-wide swaps made by refinePage and refineScore,
/// for a system whose first measure was rebuilt on its own.
int relinkSystemStart(score::Score& score, int measureIndex, const SlurAdapter& adapter) {
    const score::Measure* measure = score.measure(measureIndex);
    if (measure == nullptr) {
        return 0;
    }

    int swaps = 0;
    const std::vector<int> voices = measure->voices;
    for (const int voiceIndex : voices) {
        const auto tiedId = tiedVoiceId(score, voiceIndex, adapter);
        if (tiedId.has_value() && *tiedId != score.voice(voiceIndex)->id) {
            logSwap(score, voiceIndex, *tiedId, "system start tie");
            score.swapVoiceId(voiceIndex, *tiedId);
            ++swaps;
        }
    }
    return swaps;
}

/// Link a rebuilt first measure of a system to the preceding system of its page, or to the
/// last system of the preceding page when a linker is available.
int relinkFirstMeasure(score::Score& score, int partIndex, int measureIndex, const CrossSlurLinker* linker) {
    const score::Part* part = score.part(partIndex);
    const int pageIndex = score.pageOfSystem(part->systemIndex);
    const score::Page* page = score.page(pageIndex);
    if (page == nullptr) {
        return 0;
    }

    if (page->systems.front() != part->systemIndex) {
        return relinkSystemStart(score, measureIndex, PageLocalSlurAdapter{});
    }

    const score::Page* previousPage = score.page(pageIndex - 1);
    if (linker == nullptr || previousPage == nullptr || previousPage->systems.empty()) {
        return 0;
    }

    const int precedingPart = score.partById(previousPage->systems.back(), part->logicalPartId);
    if (precedingPart < 0) {
        return 0;
    }

    const CrossSlurLinks links = linker->link(score, partIndex, precedingPart);
    return relinkSystemStart(score, measureIndex, ScoreLocalSlurAdapter{links});
}

}  // namespace

std::optional<int> tiedVoiceId(const score::Score& score, int voiceIndex, const SlurAdapter& adapter) {
    const score::Chord* firstChord = score.chord(score.firstChord(voiceIndex));
    if (firstChord == nullptr) {
        return std::nullopt;
    }

    // Is there an incoming tie on a head of this chord?
    for (const int noteIndex : firstChord->notes) {
        if (!score.note(noteIndex)->isHead) {
            continue;
        }

        for (const int slurIndex : score.slursAtHead(noteIndex, score::HorizontalSide::Right)) {
            if (!score.slur(slurIndex)->isTie) {
                continue;
            }

            const auto previousSlur = partnerOf(score, adapter, slurIndex);
            if (!previousSlur.has_value()) {
                continue;
            }

            const int leftHead = score.slurHead(*previousSlur, score::HorizontalSide::Left);
            if (leftHead < 0) {
                continue;
            }

            // Unresolved when rhythm could not process the whole previous measure
            const int leftVoice = score.voiceOfNote(leftHead);
            if (leftVoice >= 0) {
                return score.voice(leftVoice)->id;
            }
        }
    }

    return std::nullopt;
}

void refineStack(score::Score& score, int stackIndex) {
    const score::MeasureStack* stack = score.stack(stackIndex);
    if (stack == nullptr) {
        return;
    }

    for (const int measureIndex : stack->measures) {
        std::vector<int> voices = score.measure(measureIndex)->voices;
        std::stable_sort(voices.begin(), voices.end(), VoicePositionLess{score});

        int id = 0;
        for (const int voiceIndex : voices) {
            score.setVoiceId(voiceIndex, ++id);
        }
        score.setVoiceOrder(measureIndex, std::move(voices));
        setCueVoices(score, measureIndex);
    }
}

int refineMeasure(score::Score& score, int measureIndex, int previousMeasureIndex) {
    const score::Measure* measure = score.measure(measureIndex);
    if (measure == nullptr) {
        return 0;
    }

    int swaps = 0;
    const std::vector<int> voices = measure->voices;
    for (const int voiceIndex : voices) {
        const int firstChord = score.firstChord(voiceIndex);

        if (previousMeasureIndex >= 0) {
            // Tie-based voice link
            const auto tiedId = tiedVoiceId(score, voiceIndex, SystemLocalSlurAdapter{});
            if (tiedId.has_value() && *tiedId != score.voice(voiceIndex)->id) {
                logSwap(score, voiceIndex, *tiedId, "tie");
                score.swapVoiceId(voiceIndex, *tiedId);
                ++swaps;
            }

            // Annotation-based voice link
            if (firstChord >= 0) {
                const auto linkedId = sameVoiceId(score, firstChord, previousMeasureIndex);
                if (linkedId.has_value() && *linkedId != score.voice(voiceIndex)->id) {
                    logSwap(score, voiceIndex, *linkedId, "same-voice");
                    score.swapVoiceId(voiceIndex, *linkedId);
                    ++swaps;
                }
            }
        }

        // Explicit hint wins over inferred links
        if (firstChord >= 0) {
            const auto preferredId = score.chord(firstChord)->preferredVoiceId;
            if (preferredId.has_value() && *preferredId != score.voice(voiceIndex)->id) {
                logSwap(score, voiceIndex, *preferredId, "preferred");
                score.swapVoiceId(voiceIndex, *preferredId);
                ++swaps;
            }
        }
    }

    return swaps;
}

int refineSystem(score::Score& score, int systemIndex) {
    const score::System* system = score.system(systemIndex);
    if (system == nullptr) {
        return 0;
    }

    int swaps = 0;
    for (const int partIndex : system->parts) {
        int previousMeasure = -1;
        for (const int stackIndex : system->stacks) {
            const int measureIndex = score.measureAt(partIndex, stackIndex);
            swaps += refineMeasure(score, measureIndex, previousMeasure);
            previousMeasure = measureIndex;
        }
    }
    return swaps;
}

int refineStackBoundaries(score::Score& score, int stackIndex, const CrossSlurLinker* linker) {
    const score::MeasureStack* stack = score.stack(stackIndex);
    if (stack == nullptr) {
        return 0;
    }

    const int previousStack = score.previousSibling(stackIndex);
    const int nextStack = score.nextSibling(stackIndex);

    int swaps = 0;
    for (const int partIndex : score.system(stack->systemIndex)->parts) {
        const int measureIndex = score.measureAt(partIndex, stackIndex);
        const int previousMeasure = previousStack >= 0 ? score.measureAt(partIndex, previousStack) : -1;
        swaps += refineMeasure(score, measureIndex, previousMeasure);
        if (previousStack < 0) {
            swaps += relinkFirstMeasure(score, partIndex, measureIndex, linker);
        }

        if (nextStack >= 0) {
            swaps += refineMeasure(score, score.measureAt(partIndex, nextStack), measureIndex);
        }
    }
    return swaps;
}

int refinePage(score::Score& score, int pageIndex) {
    const score::Page* page = score.page(pageIndex);
    if (page == nullptr || page->systems.empty()) {
        return 0;
    }

    Logger::logDebug("refinePage page#" + std::to_string(pageIndex));
    const int firstSystem = page->systems.front();
    const SlurAdapter adapter = PageLocalSlurAdapter{};

    int swaps = 0;
    for (const int logicalPartId : page->logicalPartIds) {
        for (const int systemIndex : page->systems) {
            if (systemIndex == firstSystem) {
                continue;
            }

            const int partIndex = score.partById(systemIndex, logicalPartId);
            if (partIndex < 0) {
                continue;
            }

            // A part may have no measure at all
            const score::Measure* firstMeasure = score.measure(score.firstMeasure(partIndex));
            if (firstMeasure == nullptr) {
                continue;
            }

            const std::vector<int> voices = firstMeasure->voices;
            for (const int voiceIndex : voices) {
                const auto tiedId = tiedVoiceId(score, voiceIndex, adapter);
                const int currentId = score.voice(voiceIndex)->id;
                if (tiedId.has_value() && *tiedId != currentId) {
                    logSwap(score, voiceIndex, *tiedId, "system tie");
                    score.swapPartVoiceIds(partIndex, currentId, *tiedId);
                    ++swaps;
                }
            }
        }
    }
    return swaps;
}

int refineScore(score::Score& score, const CrossSlurLinker& linker, const std::vector<int>& selectedPages) {
    const std::unordered_set<int> selection(selectedPages.begin(), selectedPages.end());
    int modifs = 0;
    int previousSystem = -1;  // Last system of preceding page, if any

    for (const auto& page : score.pages()) {
        if ((!selection.empty() && !selection.contains(page.index)) || page.systems.empty()) {
            previousSystem = -1;
            continue;
        }

        if (previousSystem >= 0) {
            for (const auto& logicalPart : score.logicalParts()) {
                if (!score.pageHasLogicalPart(page.index, logicalPart.id)) {
                    continue;
                }

                const int partIndex = score.partById(page.systems.front(), logicalPart.id);
                if (partIndex < 0) {
                    continue;  // not in the first system of this page
                }

                std::vector<int> orphans =
                    score.partSlurs(partIndex, [&](const score::Slur& slur) { return score.isBeginningOrphan(slur.index); });

                const int precedingPart = score.partById(previousSystem, logicalPart.id);
                if (precedingPart >= 0) {
                    std::vector<int> precedingOrphans = score.partSlurs(
                        precedingPart, [&](const score::Slur& slur) { return score.isEndingOrphan(slur.index); });

                    const CrossSlurLinks links = linker.link(score, partIndex, precedingPart);
                    for (const auto& [slurIndex, precedingSlurIndex] : links) {
                        checkCrossTie(score, slurIndex, precedingSlurIndex);
                    }

                    // Purge orphans across pages
                    std::erase_if(orphans, [&](int slurIndex) { return links.contains(slurIndex); });
                    std::erase_if(precedingOrphans, [&](int slurIndex) {
                        return std::any_of(links.begin(), links.end(),
                                           [slurIndex](const auto& entry) { return entry.second == slurIndex; });
                    });
                    discardOrphans(score, precedingOrphans, score::HorizontalSide::Right);

                    const score::Measure* firstMeasure = score.measure(score.firstMeasure(partIndex));
                    if (firstMeasure != nullptr) {
                        const SlurAdapter adapter = ScoreLocalSlurAdapter{links};
                        const std::vector<int> voices = firstMeasure->voices;
                        for (const int voiceIndex : voices) {
                            const auto tiedId = tiedVoiceId(score, voiceIndex, adapter);
                            const int currentId = score.voice(voiceIndex)->id;
                            if (tiedId.has_value() && *tiedId != currentId) {
                                logSwap(score, voiceIndex, *tiedId, "page tie");
                                score.swapPageVoiceIds(page.index, logicalPart.id, currentId, *tiedId);
                                ++modifs;
                            }
                        }
                    }
                }

                discardOrphans(score, orphans, score::HorizontalSide::Left);
            }
        }

        previousSystem = page.systems.back();
    }

    Logger::log("refineScore modifications: " + std::to_string(modifs));
    return modifs;
}

}  // namespace rhythmlink::rhythm
