#include "rhythmlink/rhythm/VoiceOrder.hpp"

namespace rhythmlink::rhythm {
namespace {

int compareInts(int lhs, int rhs) {
    return (lhs < rhs) ? -1 : ((lhs > rhs) ? 1 : 0);
}

int compareOrdinates(const score::Chord& c1, const score::Chord& c2) {
    return compareInts(c1.center.y, c2.center.y);
}

int stackOf(const score::Score& score, const score::Voice& voice) {
    const score::Measure* measure = score.measure(voice.measureIndex);
    return measure == nullptr ? -1 : measure->stackIndex;
}

}  // namespace

int orderById(const score::Voice& v1, const score::Voice& v2) {
    return compareInts(v1.id, v2.id);
}

int orderByPosition(const score::Score& score, const score::Voice& v1, const score::Voice& v2) {
    const int stack1 = stackOf(score, v1);
    const int stack2 = stackOf(score, v2);
    if (stack1 < 0 || stack1 != stack2) {
        throw PreconditionViolation("Comparing voices in different stacks");
    }

    // Different parts
    const score::Part* p1 = score.part(score.measure(v1.measureIndex)->partIndex);
    const score::Part* p2 = score.part(score.measure(v2.measureIndex)->partIndex);
    if (p1 != p2) {
        return compareInts(p1->id, p2->id);
    }

    if (v1.family != v2.family) {
        return compareInts(static_cast<int>(v1.family), static_cast<int>(v2.family));
    }

    const score::Chord* c1 = score.chord(score.firstChord(v1.index));
    const score::Chord* c2 = score.chord(score.firstChord(v2.index));
    if (c1 == nullptr || c2 == nullptr) {
        // Chordless voices go last, in ID order.
        if (c1 != c2) {
            return c1 == nullptr ? 1 : -1;
        }
        return orderById(v1, v2);
    }

    if (c1->slotId.has_value() && c2->slotId.has_value()) {
        const int comp = compareInts(*c1->slotId, *c2->slotId);
        if (comp != 0) {
            return comp;
        }
        return compareOrdinates(*c1, *c2);
    }

    // At least one whole rest, which starts on slot 1 by definition
    if (c2->slotId.has_value() && *c2->slotId > 1) {
        return -1;
    }
    if (c1->slotId.has_value() && *c1->slotId > 1) {
        return 1;
    }
    return compareOrdinates(*c1, *c2);
}

bool VoicePositionLess::operator()(int lhs, int rhs) const {
    return orderByPosition(score, *score.voice(lhs), *score.voice(rhs)) < 0;
}

VoiceColor colorOf(int id) {
    const int count = colorCount();
    const int index = ((id - 1) % count + count) % count;
    return kVoiceColors[static_cast<size_t>(index)];
}

VoiceColor colorOf(const score::Voice& voice) {
    return colorOf(voice.id);
}

}  // namespace rhythmlink::rhythm
