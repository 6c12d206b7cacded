#include "rhythmlink/rhythm/RhythmSession.hpp"

#include "FakeRhythmBuilder.hpp"
#include "ScoreTestHelpers.hpp"

#include <gtest/gtest.h>

namespace rhythmlink::rhythm {
namespace {

using edit::EditBatch;
using edit::EntityKind;
using edit::EntityTask;
using edit::TaskAction;
using score::Point;
using score::Score;
using test_helpers::addBareChord;
using test_helpers::addSystemLayout;
using test_helpers::addVoiceWithHead;
using test_helpers::FakeRhythmBuilder;

class RhythmSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        page_ = score_.addPage();
        layout_ = addSystemLayout(score_, page_, {1}, 3);
        for (size_t i = 0; i < layout_.stacks.size(); ++i) {
            const int measure = score_.measureAt(layout_.parts[0], layout_.stacks[i]);
            const int x = static_cast<int>(i) * test_helpers::kStackWidth + 10;
            addBareChord(score_, measure, {x, 10});
            addBareChord(score_, measure, {x, 50});
        }

        session_.apply(EditBatch{.description = "Load page", .tasks = {edit::PageTask{.pageIndex = page_}}});
    }

    EditBatch entityBatch(TaskAction action, EntityKind kind, Point center) const {
        return EditBatch{
            .description = edit::toString(kind),
            .tasks = {EntityTask{.action = action, .kind = kind, .systemIndex = layout_.system, .center = center}},
        };
    }

    std::vector<int> stacks(std::initializer_list<int> positions) const {
        std::vector<int> result;
        for (const int position : positions) {
            result.push_back(layout_.stacks[static_cast<size_t>(position)]);
        }
        return result;
    }

    int builds(int position) const { return builder_.buildCount(layout_.stacks[static_cast<size_t>(position)]); }

    Score score_;
    FakeRhythmBuilder builder_;
    RhythmSession session_{score_, builder_};
    int page_ = -1;
    test_helpers::SystemLayout layout_;
};

TEST_F(RhythmSessionTest, InitialPageBatchBuildsEveryStack) {
    EXPECT_EQ(builds(0), 1);
    EXPECT_EQ(builds(1), 1);
    EXPECT_EQ(builds(2), 1);
    EXPECT_EQ(session_.history().undoDescription(), "Load page");
}

TEST_F(RhythmSessionTest, NoteEditRecomputesItsStack) {
    const auto impact = session_.apply(entityBatch(TaskAction::Addition, EntityKind::Head, Point{150, 30}));

    EXPECT_EQ(impact.stacks, stacks({1}));
    EXPECT_EQ(builds(0), 1);
    EXPECT_EQ(builds(1), 2);
    EXPECT_EQ(builds(2), 1);
}

TEST_F(RhythmSessionTest, BarlineAdditionUndoAndRedo) {
    const auto done = session_.apply(entityBatch(TaskAction::Addition, EntityKind::Barline, Point{50, 10}));
    EXPECT_EQ(done.stacks, stacks({0, 1}));

    const auto undone = session_.undo();
    ASSERT_TRUE(undone.has_value());
    EXPECT_EQ(undone->stacks, stacks({0}));

    const auto redone = session_.redo();
    ASSERT_TRUE(redone.has_value());
    EXPECT_EQ(redone->stacks, stacks({0, 1}));

    EXPECT_EQ(builds(0), 4);
    EXPECT_EQ(builds(1), 3);
    EXPECT_EQ(builds(2), 1);
}

TEST_F(RhythmSessionTest, UndoneBarlineRemovalWidens) {
    const auto done = session_.apply(entityBatch(TaskAction::Removal, EntityKind::Barline, Point{150, 10}));
    EXPECT_EQ(done.stacks, stacks({1}));

    const auto undone = session_.undo();
    ASSERT_TRUE(undone.has_value());
    EXPECT_EQ(undone->stacks, stacks({1, 2}));
}

TEST_F(RhythmSessionTest, NeutralEditIsRecordedWithoutRecompute) {
    const auto impact = session_.apply(entityBatch(TaskAction::Addition, EntityKind::Lyric, Point{150, 90}));

    EXPECT_TRUE(impact.isEmpty());
    EXPECT_EQ(builds(1), 1);
    EXPECT_EQ(session_.history().undoDescription(), "Lyric");
}

TEST_F(RhythmSessionTest, TimeSignatureRecomputesWholePage) {
    const auto impact = session_.apply(entityBatch(TaskAction::Addition, EntityKind::TimeSignature, Point{5, 10}));

    EXPECT_TRUE(impact.onPage);
    EXPECT_EQ(builds(0), 2);
    EXPECT_EQ(builds(1), 2);
    EXPECT_EQ(builds(2), 2);
}

TEST_F(RhythmSessionTest, UndoPastHistoryReturnsNothing) {
    ASSERT_TRUE(session_.undo().has_value());
    EXPECT_FALSE(session_.undo().has_value());
    EXPECT_FALSE(session_.history().canUndo());
    EXPECT_TRUE(session_.history().canRedo());
}

TEST_F(RhythmSessionTest, NewEditDropsRedo) {
    session_.apply(entityBatch(TaskAction::Addition, EntityKind::Stem, Point{20, 10}));
    ASSERT_TRUE(session_.undo().has_value());
    ASSERT_TRUE(session_.history().canRedo());

    session_.apply(entityBatch(TaskAction::Addition, EntityKind::Beam, Point{20, 10}));
    EXPECT_FALSE(session_.history().canRedo());
    EXPECT_FALSE(session_.redo().has_value());
}

// Tie leaving voice 2 of page 1 for voice 1 of page 2, five units lower on its staff.
Score makeTwoPageScore(test_helpers::VoiceHandle& arrival) {
    Score score;
    score.addLogicalPart(1, "Violin");
    const auto first = addSystemLayout(score, score.addPage(), {1}, 1);
    const int m0 = score.firstMeasure(first.parts[0]);
    addVoiceWithHead(score, m0, 1, {10, 10});
    const auto departure = addVoiceWithHead(score, m0, 2, {10, 50});
    score.addSlur(first.parts[0], departure.head, -1, true);

    const auto second = addSystemLayout(score, score.addPage(), {1}, 1);
    const int m1 = score.firstMeasure(second.parts[0]);
    arrival = addVoiceWithHead(score, m1, 1, {10, 55});
    addVoiceWithHead(score, m1, 2, {10, 90});
    score.addSlur(second.parts[0], -1, arrival.head, true);
    return score;
}

TEST(RhythmSessionScoreTest, RefineScoreUsesConfiguredTolerance) {
    FakeRhythmBuilder builder;

    test_helpers::VoiceHandle arrival;
    Score loose = makeTwoPageScore(arrival);
    RhythmSession looseSession(loose, builder);
    EXPECT_EQ(looseSession.refineScore(), 1);
    EXPECT_EQ(test_helpers::voiceIdOf(loose, arrival), 2);

    Score strict = makeTwoPageScore(arrival);
    RhythmSession strictSession(strict, builder, RhythmConfig{.crossSlurMaxOrdinateDelta = 2});
    EXPECT_EQ(strictSession.refineScore(), 0);
    EXPECT_EQ(test_helpers::voiceIdOf(strict, arrival), 1);
}

struct OneStackPage {
    int page = -1;
    int system = -1;
    int part = -1;
    test_helpers::BareChord upper;
    test_helpers::BareChord lower;
};

// A page of one system, part and stack holding an upper chord and a lower chord 40 units below.
OneStackPage addOneStackPage(Score& score, int upperY) {
    OneStackPage result;
    result.page = score.addPage();
    const auto layout = addSystemLayout(score, result.page, {1}, 1);
    result.system = layout.system;
    result.part = layout.parts[0];
    const int measure = score.firstMeasure(result.part);
    result.upper = addBareChord(score, measure, {10, upperY});
    result.lower = addBareChord(score, measure, {10, upperY + 40});
    return result;
}

int voiceIdOfChord(const Score& score, const test_helpers::BareChord& chord) {
    const score::Voice* voice = score.voice(score.chord(chord.chord)->voiceIndex);
    return voice == nullptr ? -1 : voice->id;
}

EditBatch pageBatch(int pageIndex) {
    return EditBatch{.description = "Page", .tasks = {edit::PageTask{.pageIndex = pageIndex}}};
}

TEST(RhythmSessionScoreTest, PageEditKeepsVoicesLinkedAcrossPageBreak) {
    Score score;
    score.addLogicalPart(1, "Violin");
    const auto first = addOneStackPage(score, 10);
    const auto second = addOneStackPage(score, 50);
    score.addSlur(first.part, first.lower.head, -1, true);
    score.addSlur(second.part, -1, second.upper.head, true);

    FakeRhythmBuilder builder;
    RhythmSession session(score, builder);
    session.apply(pageBatch(first.page));
    session.apply(pageBatch(second.page));
    EXPECT_EQ(voiceIdOfChord(score, first.lower), 2);
    EXPECT_EQ(voiceIdOfChord(score, second.upper), 2);
    EXPECT_EQ(session.refineScore(), 0);

    const auto impact = session.apply(EditBatch{
        .description = "Time signature",
        .tasks = {EntityTask{.action = TaskAction::Addition,
                             .kind = EntityKind::TimeSignature,
                             .systemIndex = second.system,
                             .center = Point{5, 10}}},
    });

    ASSERT_TRUE(impact.onPage);
    EXPECT_EQ(impact.pageIndex, second.page);
    EXPECT_EQ(builder.buildCount(score.system(second.system)->stacks.front()), 2);
    EXPECT_EQ(voiceIdOfChord(score, first.lower), 2);
    EXPECT_EQ(voiceIdOfChord(score, second.upper), 2);
    EXPECT_EQ(voiceIdOfChord(score, second.lower), 1);
}

TEST(RhythmSessionScoreTest, PageEditRenumbersFollowingPages) {
    Score score;
    score.addLogicalPart(1, "Violin");
    const auto first = addOneStackPage(score, 10);
    const auto second = addOneStackPage(score, 50);
    const auto third = addOneStackPage(score, 50);
    score.addSlur(first.part, first.lower.head, -1, true);
    score.addSlur(second.part, -1, second.upper.head, true);
    score.addSlur(second.part, second.upper.head, -1, true);
    score.addSlur(third.part, -1, third.upper.head, true);

    FakeRhythmBuilder builder;
    RhythmSession session(score, builder);
    for (const auto* page : {&first, &second, &third}) {
        session.apply(pageBatch(page->page));
    }
    EXPECT_EQ(voiceIdOfChord(score, second.upper), 2);
    EXPECT_EQ(voiceIdOfChord(score, third.upper), 2);

    // First page rebuilt with its voices numbered bottom up
    builder.bottomUp = true;
    session.apply(pageBatch(first.page));

    EXPECT_EQ(voiceIdOfChord(score, first.lower), 1);
    EXPECT_EQ(voiceIdOfChord(score, second.upper), 1);
    EXPECT_EQ(voiceIdOfChord(score, second.lower), 2);
    EXPECT_EQ(voiceIdOfChord(score, third.upper), 1);
    EXPECT_EQ(voiceIdOfChord(score, third.lower), 2);
    EXPECT_EQ(builder.buildCount(score.system(second.system)->stacks.front()), 1);
}

}  // namespace
}  // namespace rhythmlink::rhythm
