#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rhythmlink::score {

struct Point {
    int x = 0;
    int y = 0;
};

enum class HorizontalSide : uint8_t {
    Left,
    Right,
};

/// Secondary sort key of a voice within its part (staff it starts on).
enum class VoiceFamily : uint8_t {
    High,
    Low,
    Infra,
};

struct LogicalPart {
    int id = 0;
    std::string name;
};

struct Note {
    int index = -1;
    int chordIndex = -1;
    bool isHead = true;  // false for a rest
    Point center{};
    int pitch = 0;  // staff step, 0 on the middle line
};

struct Chord {
    int index = -1;
    int measureIndex = -1;
    int voiceIndex = -1;  // -1 while rhythm is unresolved
    Point center{};
    std::optional<int> slotId;
    std::optional<int> preferredVoiceId;
    bool isCue = false;
    int principalChordIndex = -1;  // chord ornamented by a cue chord
    std::vector<int> notes;
};

struct Voice {
    int index = -1;
    int id = 0;
    int measureIndex = -1;  // -1 once discarded by a rebuild, until the slot is reused
    VoiceFamily family = VoiceFamily::High;
    std::vector<int> chords;
};

struct Measure {
    int index = -1;
    int partIndex = -1;
    int stackIndex = -1;
    std::vector<int> voices;
    std::vector<int> chords;
};

struct Slur {
    int index = -1;
    int partIndex = -1;
    int leftHead = -1;
    int rightHead = -1;
    bool isTie = false;
    // Single hop continuation across a system break.
    int leftExtension = -1;
    int rightExtension = -1;
    bool crossTieConfirmed = false;
    bool discarded = false;
};

struct Part {
    int index = -1;
    int id = 0;  // part number within its system, starting at 1
    int logicalPartId = 0;
    int systemIndex = -1;
    int top = 0;  // ordinate of the top staff line
    std::vector<int> measures;  // one per stack, in stack order
    std::vector<int> slurs;
};

struct MeasureStack {
    int index = -1;
    int systemIndex = -1;
    int left = 0;   // inclusive
    int right = 0;  // exclusive
    std::vector<int> measures;  // one per part, in part order
};

struct System {
    int index = -1;
    int pageIndex = -1;
    std::vector<int> parts;
    std::vector<int> stacks;
};

struct Page {
    int index = -1;
    std::vector<int> systems;
    std::vector<int> logicalPartIds;
};

struct SameVoiceLink {
    int index = -1;
    int chordA = -1;
    int chordB = -1;
};

/// In-memory score document. Owns every entity in flat arenas; entities refer to each
/// other through arena indices, -1 meaning "none".
class Score {
public:
    Score() = default;

    const std::vector<LogicalPart>& logicalParts() const { return logicalParts_; }
    const std::vector<Page>& pages() const { return pages_; }
    const std::vector<System>& systems() const { return systems_; }
    const std::vector<Part>& parts() const { return parts_; }
    const std::vector<MeasureStack>& stacks() const { return stacks_; }
    const std::vector<Measure>& measures() const { return measures_; }
    const std::vector<Voice>& voices() const { return voices_; }
    const std::vector<Chord>& chords() const { return chords_; }
    const std::vector<Note>& notes() const { return notes_; }
    const std::vector<Slur>& slurs() const { return slurs_; }
    const std::vector<SameVoiceLink>& sameVoiceLinks() const { return sameVoiceLinks_; }

    const Page* page(int index) const;
    const System* system(int index) const;
    const Part* part(int index) const;
    const MeasureStack* stack(int index) const;
    const Measure* measure(int index) const;
    const Voice* voice(int index) const;
    Voice* voice(int index);
    const Chord* chord(int index) const;
    Chord* chord(int index);
    const Note* note(int index) const;
    const Slur* slur(int index) const;
    Slur* slur(int index);

    // Construction, used by the upstream producers.
    int addLogicalPart(int id, std::string name);
    int addPage();
    int addSystem(int pageIndex);
    int addPart(int systemIndex, int logicalPartId, int top = 0);
    int addStack(int systemIndex, int left, int right);
    int addVoice(int measureIndex, int id, VoiceFamily family = VoiceFamily::High);
    int addChord(int measureIndex, int voiceIndex, Point center, std::optional<int> slotId = std::nullopt);
    int addNote(int chordIndex, Point center, int pitch = 0, bool isHead = true);
    int addSlur(int partIndex, int leftHead, int rightHead, bool isTie);
    int addSameVoiceLink(int chordA, int chordB);
    bool linkExtensions(int leftSlurIndex, int rightSlurIndex);
    bool assignChordToVoice(int chordIndex, int voiceIndex);

    /// Detach every voice of the stack's measures and clear chord voices and slots.
    /// Chords and notes stay, they are the input of the next rhythm build.
    /// Detached voice slots are handed out again by addVoice.
    void resetStackRhythm(int stackIndex);

    // Structural queries.
    bool pageHasLogicalPart(int pageIndex, int logicalPartId) const;
    int partById(int systemIndex, int logicalPartId) const;
    int firstMeasure(int partIndex) const;
    int measureAt(int partIndex, int stackIndex) const;
    int stackAt(int systemIndex, const Point& point) const;
    int nextSibling(int stackIndex) const;
    int previousSibling(int stackIndex) const;
    int pageOfSystem(int systemIndex) const;
    int firstChord(int voiceIndex) const;
    int voiceOfNote(int noteIndex) const;
    int voiceById(int measureIndex, int id) const;

    // Relation queries.
    std::vector<int> sameVoiceLinksOf(int chordIndex) const;
    int oppositeChord(int linkIndex, int chordIndex) const;
    std::vector<int> slursAtHead(int noteIndex, HorizontalSide side) const;
    int slurHead(int slurIndex, HorizontalSide side) const;
    int slurExtension(int slurIndex, HorizontalSide side) const;
    std::vector<int> partSlurs(int partIndex, const std::function<bool(const Slur&)>& predicate) const;
    bool isBeginningOrphan(int slurIndex) const;
    bool isEndingOrphan(int slurIndex) const;

    // Voice ID mutations. All of them permute IDs, none creates a duplicate.
    /// Give newId to the voice; the voice of the same measure holding newId takes the old ID.
    bool swapVoiceId(int voiceIndex, int newId);
    /// Exchange id1 and id2 in every measure of the part.
    void swapPartVoiceIds(int partIndex, int id1, int id2);
    /// Exchange id1 and id2 in every measure of the logical part across the page.
    void swapPageVoiceIds(int pageIndex, int logicalPartId, int id1, int id2);
    bool setVoiceId(int voiceIndex, int id);

    void setVoiceOrder(int measureIndex, std::vector<int> voices);

private:
    void exchangeMeasureVoiceIds(Measure& measure, int id1, int id2);

    std::vector<LogicalPart> logicalParts_;
    std::vector<Page> pages_;
    std::vector<System> systems_;
    std::vector<Part> parts_;
    std::vector<MeasureStack> stacks_;
    std::vector<Measure> measures_;
    std::vector<Voice> voices_;
    std::vector<int> freeVoices_;  // discarded voice slots
    std::vector<Chord> chords_;
    std::vector<Note> notes_;
    std::vector<Slur> slurs_;
    std::vector<SameVoiceLink> sameVoiceLinks_;
};

}  // namespace rhythmlink::score
