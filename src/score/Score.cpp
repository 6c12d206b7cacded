#include "rhythmlink/score/Score.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace rhythmlink::score {
namespace {

template <typename T>
const T* atIndex(const std::vector<T>& items, int index) {
    if (index < 0 || static_cast<size_t>(index) >= items.size()) {
        return nullptr;
    }
    return &items[static_cast<size_t>(index)];
}

template <typename T>
T* atIndex(std::vector<T>& items, int index) {
    if (index < 0 || static_cast<size_t>(index) >= items.size()) {
        return nullptr;
    }
    return &items[static_cast<size_t>(index)];
}

template <typename T>
int nextIndex(const std::vector<T>& items) {
    return static_cast<int>(items.size());
}

}  // namespace

const Page* Score::page(int index) const {
    return atIndex(pages_, index);
}

const System* Score::system(int index) const {
    return atIndex(systems_, index);
}

const Part* Score::part(int index) const {
    return atIndex(parts_, index);
}

const MeasureStack* Score::stack(int index) const {
    return atIndex(stacks_, index);
}

const Measure* Score::measure(int index) const {
    return atIndex(measures_, index);
}

const Voice* Score::voice(int index) const {
    return atIndex(voices_, index);
}

Voice* Score::voice(int index) {
    return atIndex(voices_, index);
}

const Chord* Score::chord(int index) const {
    return atIndex(chords_, index);
}

Chord* Score::chord(int index) {
    return atIndex(chords_, index);
}

const Note* Score::note(int index) const {
    return atIndex(notes_, index);
}

const Slur* Score::slur(int index) const {
    return atIndex(slurs_, index);
}

Slur* Score::slur(int index) {
    return atIndex(slurs_, index);
}

int Score::addLogicalPart(int id, std::string name) {
    const int index = nextIndex(logicalParts_);
    logicalParts_.push_back(LogicalPart{.id = id, .name = std::move(name)});
    return index;
}

int Score::addPage() {
    const int index = nextIndex(pages_);
    pages_.push_back(Page{.index = index, .systems = {}, .logicalPartIds = {}});
    return index;
}

int Score::addSystem(int pageIndex) {
    Page* owner = atIndex(pages_, pageIndex);
    if (owner == nullptr) {
        return -1;
    }

    const int index = nextIndex(systems_);
    systems_.push_back(System{.index = index, .pageIndex = pageIndex, .parts = {}, .stacks = {}});
    owner->systems.push_back(index);
    return index;
}

int Score::addPart(int systemIndex, int logicalPartId, int top) {
    System* owner = atIndex(systems_, systemIndex);
    if (owner == nullptr) {
        return -1;
    }

    const int index = nextIndex(parts_);
    parts_.push_back(Part{
        .index = index,
        .id = static_cast<int>(owner->parts.size()) + 1,
        .logicalPartId = logicalPartId,
        .systemIndex = systemIndex,
        .top = top,
        .measures = {},
        .slurs = {},
    });
    owner->parts.push_back(index);

    auto& pageParts = pages_[static_cast<size_t>(owner->pageIndex)].logicalPartIds;
    if (std::find(pageParts.begin(), pageParts.end(), logicalPartId) == pageParts.end()) {
        pageParts.push_back(logicalPartId);
    }

    // Stacks created before this part get their measure now.
    for (const int stackIndex : owner->stacks) {
        const int measureIndex = nextIndex(measures_);
        measures_.push_back(Measure{.index = measureIndex, .partIndex = index, .stackIndex = stackIndex});
        parts_[static_cast<size_t>(index)].measures.push_back(measureIndex);
        stacks_[static_cast<size_t>(stackIndex)].measures.push_back(measureIndex);
    }
    return index;
}

int Score::addStack(int systemIndex, int left, int right) {
    System* owner = atIndex(systems_, systemIndex);
    if (owner == nullptr) {
        return -1;
    }

    const int index = nextIndex(stacks_);
    stacks_.push_back(MeasureStack{.index = index, .systemIndex = systemIndex, .left = left, .right = right});
    owner->stacks.push_back(index);

    for (const int partIndex : owner->parts) {
        const int measureIndex = nextIndex(measures_);
        measures_.push_back(Measure{.index = measureIndex, .partIndex = partIndex, .stackIndex = index});
        parts_[static_cast<size_t>(partIndex)].measures.push_back(measureIndex);
        stacks_[static_cast<size_t>(index)].measures.push_back(measureIndex);
    }
    return index;
}

int Score::addVoice(int measureIndex, int id, VoiceFamily family) {
    Measure* owner = atIndex(measures_, measureIndex);
    if (owner == nullptr) {
        return -1;
    }

    // Discarded slots first, so that rebuilding stacks does not grow the arena
    int index = -1;
    if (!freeVoices_.empty()) {
        index = freeVoices_.back();
        freeVoices_.pop_back();
        voices_[static_cast<size_t>(index)] =
            Voice{.index = index, .id = id, .measureIndex = measureIndex, .family = family, .chords = {}};
    } else {
        index = nextIndex(voices_);
        voices_.push_back(Voice{.index = index, .id = id, .measureIndex = measureIndex, .family = family, .chords = {}});
    }
    owner->voices.push_back(index);
    return index;
}

int Score::addChord(int measureIndex, int voiceIndex, Point center, std::optional<int> slotId) {
    Measure* owner = atIndex(measures_, measureIndex);
    if (owner == nullptr) {
        return -1;
    }

    const int index = nextIndex(chords_);
    chords_.push_back(Chord{
        .index = index,
        .measureIndex = measureIndex,
        .voiceIndex = -1,
        .center = center,
        .slotId = slotId,
        .preferredVoiceId = std::nullopt,
        .isCue = false,
        .principalChordIndex = -1,
        .notes = {},
    });
    owner->chords.push_back(index);

    if (voiceIndex >= 0) {
        assignChordToVoice(index, voiceIndex);
    }
    return index;
}

int Score::addNote(int chordIndex, Point center, int pitch, bool isHead) {
    Chord* owner = atIndex(chords_, chordIndex);
    if (owner == nullptr) {
        return -1;
    }

    const int index = nextIndex(notes_);
    notes_.push_back(Note{.index = index, .chordIndex = chordIndex, .isHead = isHead, .center = center, .pitch = pitch});
    owner->notes.push_back(index);
    return index;
}

int Score::addSlur(int partIndex, int leftHead, int rightHead, bool isTie) {
    Part* owner = atIndex(parts_, partIndex);
    if (owner == nullptr) {
        return -1;
    }

    const int index = nextIndex(slurs_);
    slurs_.push_back(Slur{
        .index = index,
        .partIndex = partIndex,
        .leftHead = leftHead,
        .rightHead = rightHead,
        .isTie = isTie,
    });
    owner->slurs.push_back(index);
    return index;
}

int Score::addSameVoiceLink(int chordA, int chordB) {
    if (chord(chordA) == nullptr || chord(chordB) == nullptr) {
        return -1;
    }

    const int index = nextIndex(sameVoiceLinks_);
    sameVoiceLinks_.push_back(SameVoiceLink{.index = index, .chordA = chordA, .chordB = chordB});
    return index;
}

bool Score::linkExtensions(int leftSlurIndex, int rightSlurIndex) {
    Slur* left = slur(leftSlurIndex);
    Slur* right = slur(rightSlurIndex);
    if (left == nullptr || right == nullptr || left == right) {
        return false;
    }

    left->rightExtension = rightSlurIndex;
    right->leftExtension = leftSlurIndex;
    return true;
}

bool Score::assignChordToVoice(int chordIndex, int voiceIndex) {
    Chord* target = chord(chordIndex);
    Voice* owner = voice(voiceIndex);
    if (target == nullptr || owner == nullptr || owner->measureIndex != target->measureIndex) {
        return false;
    }

    if (target->voiceIndex >= 0 && target->voiceIndex != voiceIndex) {
        auto& previous = voices_[static_cast<size_t>(target->voiceIndex)].chords;
        previous.erase(std::remove(previous.begin(), previous.end(), chordIndex), previous.end());
    }
    target->voiceIndex = voiceIndex;
    if (std::find(owner->chords.begin(), owner->chords.end(), chordIndex) == owner->chords.end()) {
        owner->chords.push_back(chordIndex);
    }
    return true;
}

void Score::resetStackRhythm(int stackIndex) {
    const MeasureStack* target = stack(stackIndex);
    if (target == nullptr) {
        return;
    }

    for (const int measureIndex : target->measures) {
        Measure& measure = measures_[static_cast<size_t>(measureIndex)];
        for (const int voiceIndex : measure.voices) {
            Voice& discarded = voices_[static_cast<size_t>(voiceIndex)];
            discarded.measureIndex = -1;
            discarded.chords.clear();
            freeVoices_.push_back(voiceIndex);
        }
        measure.voices.clear();

        for (const int chordIndex : measure.chords) {
            Chord& chord = chords_[static_cast<size_t>(chordIndex)];
            chord.voiceIndex = -1;
            chord.slotId.reset();
        }
    }
}

bool Score::pageHasLogicalPart(int pageIndex, int logicalPartId) const {
    const Page* owner = page(pageIndex);
    if (owner == nullptr) {
        return false;
    }
    return std::find(owner->logicalPartIds.begin(), owner->logicalPartIds.end(), logicalPartId) !=
           owner->logicalPartIds.end();
}

int Score::partById(int systemIndex, int logicalPartId) const {
    const System* owner = system(systemIndex);
    if (owner == nullptr) {
        return -1;
    }
    for (const int partIndex : owner->parts) {
        if (parts_[static_cast<size_t>(partIndex)].logicalPartId == logicalPartId) {
            return partIndex;
        }
    }
    return -1;
}

int Score::firstMeasure(int partIndex) const {
    const Part* owner = part(partIndex);
    if (owner == nullptr || owner->measures.empty()) {
        return -1;
    }
    return owner->measures.front();
}

int Score::measureAt(int partIndex, int stackIndex) const {
    const MeasureStack* owner = stack(stackIndex);
    if (owner == nullptr) {
        return -1;
    }
    for (const int measureIndex : owner->measures) {
        if (measures_[static_cast<size_t>(measureIndex)].partIndex == partIndex) {
            return measureIndex;
        }
    }
    return -1;
}

int Score::stackAt(int systemIndex, const Point& point) const {
    const System* owner = system(systemIndex);
    if (owner == nullptr) {
        return -1;
    }
    for (const int stackIndex : owner->stacks) {
        const MeasureStack& candidate = stacks_[static_cast<size_t>(stackIndex)];
        if (point.x >= candidate.left && point.x < candidate.right) {
            return stackIndex;
        }
    }
    return -1;
}

int Score::nextSibling(int stackIndex) const {
    const MeasureStack* current = stack(stackIndex);
    if (current == nullptr) {
        return -1;
    }
    const auto& siblings = systems_[static_cast<size_t>(current->systemIndex)].stacks;
    const auto it = std::find(siblings.begin(), siblings.end(), stackIndex);
    if (it == siblings.end() || std::next(it) == siblings.end()) {
        return -1;
    }
    return *std::next(it);
}

int Score::previousSibling(int stackIndex) const {
    const MeasureStack* current = stack(stackIndex);
    if (current == nullptr) {
        return -1;
    }
    const auto& siblings = systems_[static_cast<size_t>(current->systemIndex)].stacks;
    const auto it = std::find(siblings.begin(), siblings.end(), stackIndex);
    if (it == siblings.end() || it == siblings.begin()) {
        return -1;
    }
    return *std::prev(it);
}

int Score::pageOfSystem(int systemIndex) const {
    const System* owner = system(systemIndex);
    return owner == nullptr ? -1 : owner->pageIndex;
}

int Score::firstChord(int voiceIndex) const {
    const Voice* owner = voice(voiceIndex);
    if (owner == nullptr || owner->chords.empty()) {
        return -1;
    }
    return owner->chords.front();
}

int Score::voiceOfNote(int noteIndex) const {
    const Note* head = note(noteIndex);
    if (head == nullptr) {
        return -1;
    }
    const Chord* owner = chord(head->chordIndex);
    if (owner == nullptr) {
        return -1;
    }
    const Voice* resolved = voice(owner->voiceIndex);
    if (resolved == nullptr || resolved->measureIndex < 0) {
        return -1;
    }
    return resolved->index;
}

int Score::voiceById(int measureIndex, int id) const {
    const Measure* owner = measure(measureIndex);
    if (owner == nullptr) {
        return -1;
    }
    for (const int voiceIndex : owner->voices) {
        if (voices_[static_cast<size_t>(voiceIndex)].id == id) {
            return voiceIndex;
        }
    }
    return -1;
}

std::vector<int> Score::sameVoiceLinksOf(int chordIndex) const {
    std::vector<int> links;
    for (const auto& link : sameVoiceLinks_) {
        if (link.chordA == chordIndex || link.chordB == chordIndex) {
            links.push_back(link.index);
        }
    }
    return links;
}

int Score::oppositeChord(int linkIndex, int chordIndex) const {
    const SameVoiceLink* link = atIndex(sameVoiceLinks_, linkIndex);
    if (link == nullptr) {
        return -1;
    }
    if (link->chordA == chordIndex) {
        return link->chordB;
    }
    if (link->chordB == chordIndex) {
        return link->chordA;
    }
    return -1;
}

std::vector<int> Score::slursAtHead(int noteIndex, HorizontalSide side) const {
    std::vector<int> result;
    const Note* head = note(noteIndex);
    if (head == nullptr) {
        return result;
    }
    const Chord* owner = chord(head->chordIndex);
    const Measure* container = owner == nullptr ? nullptr : measure(owner->measureIndex);
    const Part* holder = container == nullptr ? nullptr : part(container->partIndex);
    if (holder == nullptr) {
        return result;
    }

    for (const int slurIndex : holder->slurs) {
        if (slurHead(slurIndex, side) == noteIndex) {
            result.push_back(slurIndex);
        }
    }
    return result;
}

int Score::slurHead(int slurIndex, HorizontalSide side) const {
    const Slur* target = slur(slurIndex);
    if (target == nullptr) {
        return -1;
    }
    return side == HorizontalSide::Left ? target->leftHead : target->rightHead;
}

int Score::slurExtension(int slurIndex, HorizontalSide side) const {
    const Slur* target = slur(slurIndex);
    if (target == nullptr) {
        return -1;
    }
    return side == HorizontalSide::Left ? target->leftExtension : target->rightExtension;
}

std::vector<int> Score::partSlurs(int partIndex, const std::function<bool(const Slur&)>& predicate) const {
    std::vector<int> result;
    const Part* holder = part(partIndex);
    if (holder == nullptr) {
        return result;
    }
    for (const int slurIndex : holder->slurs) {
        if (!predicate || predicate(slurs_[static_cast<size_t>(slurIndex)])) {
            result.push_back(slurIndex);
        }
    }
    return result;
}

bool Score::isBeginningOrphan(int slurIndex) const {
    const Slur* target = slur(slurIndex);
    return target != nullptr && !target->discarded && target->leftHead < 0 && target->leftExtension < 0;
}

bool Score::isEndingOrphan(int slurIndex) const {
    const Slur* target = slur(slurIndex);
    return target != nullptr && !target->discarded && target->rightHead < 0 && target->rightExtension < 0;
}

bool Score::swapVoiceId(int voiceIndex, int newId) {
    Voice* target = voice(voiceIndex);
    if (target == nullptr || target->measureIndex < 0 || target->id == newId) {
        return false;
    }

    const int holder = voiceById(target->measureIndex, newId);
    if (holder >= 0) {
        voices_[static_cast<size_t>(holder)].id = target->id;
    }
    target->id = newId;
    return true;
}

void Score::swapPartVoiceIds(int partIndex, int id1, int id2) {
    const Part* holder = part(partIndex);
    if (holder == nullptr || id1 == id2) {
        return;
    }
    for (const int measureIndex : holder->measures) {
        exchangeMeasureVoiceIds(measures_[static_cast<size_t>(measureIndex)], id1, id2);
    }
}

void Score::swapPageVoiceIds(int pageIndex, int logicalPartId, int id1, int id2) {
    const Page* owner = page(pageIndex);
    if (owner == nullptr) {
        return;
    }
    for (const int systemIndex : owner->systems) {
        const int partIndex = partById(systemIndex, logicalPartId);
        if (partIndex >= 0) {
            swapPartVoiceIds(partIndex, id1, id2);
        }
    }
}

bool Score::setVoiceId(int voiceIndex, int id) {
    Voice* target = voice(voiceIndex);
    if (target == nullptr) {
        return false;
    }
    target->id = id;
    return true;
}

void Score::setVoiceOrder(int measureIndex, std::vector<int> voices) {
    Measure* owner = atIndex(measures_, measureIndex);
    if (owner == nullptr || owner->voices.size() != voices.size()) {
        return;
    }
    owner->voices = std::move(voices);
}

void Score::exchangeMeasureVoiceIds(Measure& measure, int id1, int id2) {
    for (const int voiceIndex : measure.voices) {
        Voice& current = voices_[static_cast<size_t>(voiceIndex)];
        if (current.id == id1) {
            current.id = id2;
        } else if (current.id == id2) {
            current.id = id1;
        }
    }
}

}  // namespace rhythmlink::score
