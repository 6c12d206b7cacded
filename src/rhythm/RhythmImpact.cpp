#include "rhythmlink/rhythm/RhythmImpact.hpp"

#include "rhythmlink/common/Logger.hpp"

#include <algorithm>
#include <variant>

namespace rhythmlink::rhythm {
namespace {

using edit::EntityKind;
using edit::OpKind;
using edit::TaskAction;

bool isBarline(EntityKind kind) {
    return kind == EntityKind::Barline || kind == EntityKind::StaffBarline;
}

// Barline changes shift measure boundaries into the next stack.
bool widensToNextStack(const edit::EntityTask& task, OpKind opKind) {
    if (!isBarline(task.kind)) {
        return false;
    }
    if (opKind == OpKind::Undo) {
        return task.action == TaskAction::Removal;
    }
    return task.action == TaskAction::Addition;
}

int stackAt(const score::Score& score, int systemIndex, const std::optional<score::Point>& center) {
    if (!center.has_value()) {
        return -1;
    }
    return score.stackAt(systemIndex, *center);
}

}  // namespace

void RhythmImpact::add(int stackIndex) {
    if (stackIndex < 0) {
        return;
    }
    if (std::find(stacks.begin(), stacks.end(), stackIndex) == stacks.end()) {
        stacks.push_back(stackIndex);
    }
}

RhythmImpact classifyImpact(const score::Score& score, const edit::EditBatch& batch, OpKind opKind) {
    common::Logger::logDebug("RHYTHMS impact " + std::string(edit::toString(opKind)) + " " + batch.description);

    RhythmImpact impact;

    for (const auto& task : batch.tasks) {
        if (const auto* entityTask = std::get_if<edit::EntityTask>(&task); entityTask != nullptr) {
            const ImpactScope scope = impactScopeOf(entityTask->kind);
            if (scope == ImpactScope::Page) {
                impact.onPage = true;
            } else if (scope == ImpactScope::Stack) {
                const int stackIndex = stackAt(score, entityTask->systemIndex, entityTask->center);
                if (stackIndex < 0) {
                    continue;
                }
                impact.add(stackIndex);
                if (widensToNextStack(*entityTask, opKind)) {
                    impact.add(score.nextSibling(stackIndex));
                }
            }
        } else if (const auto* relationTask = std::get_if<edit::RelationTask>(&task); relationTask != nullptr) {
            if (impactScopeOf(relationTask->kind) == ImpactScope::Stack) {
                impact.add(stackAt(score, relationTask->systemIndex, relationTask->sourceCenter));
                impact.add(stackAt(score, relationTask->systemIndex, relationTask->targetCenter));
            }
        } else if (const auto* stackTask = std::get_if<edit::StackTask>(&task); stackTask != nullptr) {
            if (score.stack(stackTask->stackIndex) != nullptr) {
                impact.add(stackTask->stackIndex);
            }
        } else if (const auto* pageTask = std::get_if<edit::PageTask>(&task); pageTask != nullptr) {
            impact.onPage = true;
            impact.pageIndex = pageTask->pageIndex;
        } else if (const auto* mergeTask = std::get_if<edit::SystemMergeTask>(&task); mergeTask != nullptr) {
            impact.onPage = true;
            impact.pageIndex = score.pageOfSystem(mergeTask->systemIndex);
        }
    }

    if (impact.pageIndex < 0) {
        impact.pageIndex = score.pageOfSystem(edit::batchSystem(batch));
    }
    if (impact.pageIndex < 0 && !impact.stacks.empty()) {
        impact.pageIndex = score.pageOfSystem(score.stack(impact.stacks.front())->systemIndex);
    }

    return impact;
}

std::string describe(const RhythmImpact& impact) {
    std::string text = "RhythmsImpact{page:";
    text += impact.onPage ? "true" : "false";
    text += " stacks:[";
    for (size_t i = 0; i < impact.stacks.size(); ++i) {
        if (i > 0) {
            text += ",";
        }
        text += std::to_string(impact.stacks[i]);
    }
    text += "]}";
    return text;
}

}  // namespace rhythmlink::rhythm
