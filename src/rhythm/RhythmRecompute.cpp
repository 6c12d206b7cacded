#include "rhythmlink/rhythm/RhythmRecompute.hpp"

#include "rhythmlink/common/Logger.hpp"
#include "rhythmlink/rhythm/Voices.hpp"

#include <string>
#include <utility>

namespace rhythmlink::rhythm {

RhythmRecomputeDriver::RhythmRecomputeDriver(RhythmBuilder& builder, RhythmConfig config)
    : builder_(builder),
      config_(std::move(config)),
      linker_(config_.crossSlurMaxOrdinateDelta, config_.crossSlurMaxPitchDelta) {}

void RhythmRecomputeDriver::processPage(score::Score& score, int pageIndex) {
    const score::Page* page = score.page(pageIndex);
    if (page == nullptr) {
        common::Logger::logError("processPage: no page #" + std::to_string(pageIndex));
        return;
    }

    common::Logger::log("Rhythm of page #" + std::to_string(pageIndex));
    for (const int systemIndex : page->systems) {
        for (const int stackIndex : score.system(systemIndex)->stacks) {
            rebuildStack(score, stackIndex);
        }
    }

    int swaps = 0;
    for (const int systemIndex : page->systems) {
        swaps += refineSystem(score, systemIndex);
    }
    swaps += refinePage(score, pageIndex);
    swaps += relinkPageBreaks(score, pageIndex);
    common::Logger::logDebug("Page #" + std::to_string(pageIndex) + " voice swaps: " + std::to_string(swaps));
}

void RhythmRecomputeDriver::reprocessStack(score::Score& score, int stackIndex) {
    if (score.stack(stackIndex) == nullptr) {
        common::Logger::logError("reprocessStack: no stack #" + std::to_string(stackIndex));
        return;
    }

    common::Logger::log("Rhythm of stack #" + std::to_string(stackIndex));
    rebuildStack(score, stackIndex);
    const int swaps = refineStackBoundaries(score, stackIndex, &linker_);
    common::Logger::logDebug("Stack #" + std::to_string(stackIndex) + " voice swaps: " + std::to_string(swaps));
}

int RhythmRecomputeDriver::relinkPageBreaks(score::Score& score, int pageIndex) {
    int modifs = refineScore(score, linker_, {pageIndex - 1, pageIndex});

    const int pageCount = static_cast<int>(score.pages().size());
    for (int next = pageIndex + 1; next < pageCount; ++next) {
        const int changed = refineScore(score, linker_, {next - 1, next});
        modifs += changed;
        if (changed == 0) {
            break;
        }
    }
    return modifs;
}

void RhythmRecomputeDriver::apply(score::Score& score, const RhythmImpact& impact) {
    common::Logger::logDebug(describe(impact));

    if (impact.onPage) {
        processPage(score, impact.pageIndex);
        return;
    }

    for (const int stackIndex : impact.stacks) {
        reprocessStack(score, stackIndex);
    }
}

void RhythmRecomputeDriver::rebuildStack(score::Score& score, int stackIndex) {
    score.resetStackRhythm(stackIndex);
    builder_.buildStack(score, stackIndex);
    if (config_.refineStacksOnRecompute) {
        refineStack(score, stackIndex);
    }
}

}  // namespace rhythmlink::rhythm
