#include "rhythmlink/rhythm/VoiceOrder.hpp"

#include "ScoreTestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

namespace rhythmlink::rhythm {
namespace {

using score::Score;
using score::VoiceFamily;
using test_helpers::addSystemLayout;
using test_helpers::addVoiceWithHead;

class VoiceOrderTest : public ::testing::Test {
protected:
    void SetUp() override {
        layout_ = addSystemLayout(score_, score_.addPage(), {1, 2}, 2);
        upper_ = score_.measureAt(layout_.parts[0], layout_.stacks[0]);
        lower_ = score_.measureAt(layout_.parts[1], layout_.stacks[0]);
        nextUpper_ = score_.measureAt(layout_.parts[0], layout_.stacks[1]);
    }

    int compare(int v1, int v2) const { return orderByPosition(score_, *score_.voice(v1), *score_.voice(v2)); }

    Score score_;
    test_helpers::SystemLayout layout_;
    int upper_ = -1;
    int lower_ = -1;
    int nextUpper_ = -1;
};

TEST_F(VoiceOrderTest, OrderByIdComparesIds) {
    const auto a = addVoiceWithHead(score_, upper_, 1, {10, 10});
    const auto b = addVoiceWithHead(score_, upper_, 3, {10, 50});

    EXPECT_LT(orderById(*score_.voice(a.voice), *score_.voice(b.voice)), 0);
    EXPECT_GT(orderById(*score_.voice(b.voice), *score_.voice(a.voice)), 0);
    EXPECT_EQ(orderById(*score_.voice(a.voice), *score_.voice(a.voice)), 0);
}

TEST_F(VoiceOrderTest, VoicesOfDifferentStacksCannotBeCompared) {
    const auto a = addVoiceWithHead(score_, upper_, 1, {10, 10});
    const auto b = addVoiceWithHead(score_, nextUpper_, 1, {110, 10});

    EXPECT_THROW(compare(a.voice, b.voice), PreconditionViolation);
}

TEST_F(VoiceOrderTest, DetachedVoiceCannotBeCompared) {
    const auto a = addVoiceWithHead(score_, upper_, 1, {10, 10});
    const auto b = addVoiceWithHead(score_, upper_, 2, {10, 50});
    score_.resetStackRhythm(layout_.stacks[0]);

    EXPECT_THROW(compare(a.voice, b.voice), PreconditionViolation);
}

TEST_F(VoiceOrderTest, PartNumberComesFirst) {
    const auto top = addVoiceWithHead(score_, upper_, 2, {10, 190}, 3);
    const auto bottom = addVoiceWithHead(score_, lower_, 1, {10, 200}, 1);

    EXPECT_LT(compare(top.voice, bottom.voice), 0);
    EXPECT_GT(compare(bottom.voice, top.voice), 0);
}

TEST_F(VoiceOrderTest, FamilyBeforeSlot) {
    const auto high = addVoiceWithHead(score_, upper_, 1, {10, 90}, 2, 0, VoiceFamily::High);
    const auto low = addVoiceWithHead(score_, upper_, 2, {10, 10}, 1, 0, VoiceFamily::Low);
    const auto infra = addVoiceWithHead(score_, upper_, 3, {10, 5}, 1, 0, VoiceFamily::Infra);

    EXPECT_LT(compare(high.voice, low.voice), 0);
    EXPECT_LT(compare(low.voice, infra.voice), 0);
}

TEST_F(VoiceOrderTest, SlotThenOrdinate) {
    const auto late = addVoiceWithHead(score_, upper_, 1, {40, 10}, 2);
    const auto early = addVoiceWithHead(score_, upper_, 2, {10, 90}, 1);
    const auto earlyHigh = addVoiceWithHead(score_, upper_, 3, {10, 30}, 1);

    EXPECT_LT(compare(early.voice, late.voice), 0);
    EXPECT_LT(compare(earlyHigh.voice, early.voice), 0);
    EXPECT_EQ(compare(early.voice, early.voice), 0);
}

TEST_F(VoiceOrderTest, WholeRestStartsOnFirstSlot) {
    const auto wholeRest = addVoiceWithHead(score_, upper_, 1, {50, 90}, std::nullopt);
    const auto later = addVoiceWithHead(score_, upper_, 2, {60, 10}, 2);
    const auto first = addVoiceWithHead(score_, upper_, 3, {10, 10}, 1);

    // Whole rest precedes any voice starting after slot 1.
    EXPECT_LT(compare(wholeRest.voice, later.voice), 0);
    EXPECT_GT(compare(later.voice, wholeRest.voice), 0);

    // Against a voice on slot 1, ordinate decides.
    EXPECT_GT(compare(wholeRest.voice, first.voice), 0);
    EXPECT_LT(compare(first.voice, wholeRest.voice), 0);
}

TEST_F(VoiceOrderTest, TwoWholeRestsCompareByOrdinate) {
    const auto low = addVoiceWithHead(score_, upper_, 1, {50, 90}, std::nullopt);
    const auto high = addVoiceWithHead(score_, upper_, 2, {50, 20}, std::nullopt);

    EXPECT_LT(compare(high.voice, low.voice), 0);
}

TEST_F(VoiceOrderTest, ChordlessVoicesGoLast) {
    const int empty = score_.addVoice(upper_, 1);
    const auto full = addVoiceWithHead(score_, upper_, 2, {10, 90}, 3);
    const int otherEmpty = score_.addVoice(upper_, 4);

    EXPECT_GT(compare(empty, full.voice), 0);
    EXPECT_LT(compare(full.voice, empty), 0);
    EXPECT_LT(compare(empty, otherEmpty), 0);
}

TEST_F(VoiceOrderTest, PositionLessSortsVoices) {
    const auto c = addVoiceWithHead(score_, upper_, 1, {10, 90}, 1);
    const auto a = addVoiceWithHead(score_, upper_, 2, {10, 10}, 1);
    const auto b = addVoiceWithHead(score_, upper_, 3, {10, 50}, 1);

    std::vector<int> voices = score_.measure(upper_)->voices;
    std::sort(voices.begin(), voices.end(), VoicePositionLess{score_});
    EXPECT_EQ(voices, (std::vector<int>{a.voice, b.voice, c.voice}));
}

TEST(VoiceColorTest, PaletteIsUsedCircularly) {
    ASSERT_EQ(colorCount(), 8);
    for (int id = 1; id <= 64; ++id) {
        EXPECT_EQ(colorOf(id), colorOf(id + colorCount())) << "id " << id;
        EXPECT_EQ(colorOf(id), kVoiceColors[static_cast<size_t>((id - 1) % colorCount())]) << "id " << id;
    }
    EXPECT_EQ(colorOf(1), (VoiceColor{128, 64, 255, kVoiceColorAlpha}));
    EXPECT_EQ(colorOf(9), colorOf(1));
    EXPECT_NE(colorOf(1), colorOf(2));
}

TEST(VoiceColorTest, NonPositiveIdsWrapAround) {
    EXPECT_EQ(colorOf(0), kVoiceColors[7]);
    EXPECT_EQ(colorOf(-7), kVoiceColors[0]);
}

TEST(VoiceColorTest, VoiceUsesItsId) {
    Score score;
    const auto layout = addSystemLayout(score, score.addPage(), {1}, 1);
    const auto handle = addVoiceWithHead(score, score.firstMeasure(layout.parts[0]), 3, {10, 10});

    EXPECT_EQ(colorOf(*score.voice(handle.voice)), colorOf(3));
}

}  // namespace
}  // namespace rhythmlink::rhythm
