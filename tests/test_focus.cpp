#include <gtest/gtest.h>
#include "tiledash/container/Container.hpp"
#include "tiledash/focus/FocusTracker.hpp"

using namespace tdash;

namespace {

std::unique_ptr<Container> mustCreate(const std::vector<Option>& options) {
    auto result = Container::create(options);
    EXPECT_TRUE(result.isOk()) << (result.isOk() ? "" : result.error().toString());
    return result.isOk() ? std::move(result).value() : nullptr;
}

std::string activeId(const Container& root) {
    return root.focusTracker().active()->id();
}

// A | (B | C)
std::vector<Option> threeLeaves(std::vector<Option> a = {}, std::vector<Option> b = {},
                                std::vector<Option> c = {}) {
    a.push_back(id("A"));
    b.push_back(id("B"));
    c.push_back(id("C"));
    return {
        id("root"),
        keyFocusNext(keys::Tab),
        keyFocusPrevious(keys::BackTab),
        splitVertical(
            Left{a},
            Right{{id("BC"), splitVertical(Left{b}, Right{c})}}),
    };
}

} // namespace

TEST(FocusTrackerTest, CollectsLeavesDepthFirst) {
    auto root = mustCreate(threeLeaves());
    ASSERT_TRUE(root);

    std::vector<std::string> ids;
    for (Container* leaf : root->focusTracker().collectLeavesDFS()) {
        ids.push_back(leaf->id());
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(FocusTrackerTest, NextVisitsEveryLeafAndWraps) {
    auto root = mustCreate(threeLeaves({focused()}));
    ASSERT_TRUE(root);
    FocusTracker& focus = root->focusTracker();

    EXPECT_EQ(activeId(*root), "A");
    focus.next();
    EXPECT_EQ(activeId(*root), "B");
    focus.next();
    EXPECT_EQ(activeId(*root), "C");
    focus.next();
    EXPECT_EQ(activeId(*root), "A");
}

TEST(FocusTrackerTest, PreviousWraps) {
    auto root = mustCreate(threeLeaves({focused()}));
    ASSERT_TRUE(root);
    FocusTracker& focus = root->focusTracker();

    focus.previous();
    EXPECT_EQ(activeId(*root), "C");
    focus.previous();
    EXPECT_EQ(activeId(*root), "B");
}

TEST(FocusTrackerTest, FromSplitContainerStartsAtEnds) {
    auto root = mustCreate(threeLeaves());
    ASSERT_TRUE(root);
    FocusTracker& focus = root->focusTracker();

    ASSERT_EQ(activeId(*root), "root");
    focus.next();
    EXPECT_EQ(activeId(*root), "A");

    focus.setActive(root->findById("BC"));
    focus.previous();
    EXPECT_EQ(activeId(*root), "C");
}

TEST(FocusTrackerTest, SkippedLeavesNeverReceiveFocusFromNextOrPrevious) {
    auto root = mustCreate(threeLeaves({focused()}, {keyFocusSkip()}));
    ASSERT_TRUE(root);
    FocusTracker& focus = root->focusTracker();

    focus.next();
    EXPECT_EQ(activeId(*root), "C");
    focus.next();
    EXPECT_EQ(activeId(*root), "A");
    focus.previous();
    EXPECT_EQ(activeId(*root), "C");
    focus.previous();
    EXPECT_EQ(activeId(*root), "A");
}

TEST(FocusTrackerTest, SkippedLeafCanStillBeFocusedDirectly) {
    auto root = mustCreate(threeLeaves({}, {keyFocusSkip(), focused()}));
    ASSERT_TRUE(root);

    EXPECT_EQ(activeId(*root), "B");
    root->focusTracker().next();
    EXPECT_EQ(activeId(*root), "C");
}

TEST(FocusTrackerTest, AllLeavesSkippedKeepsFocus) {
    auto root = mustCreate(threeLeaves({keyFocusSkip(), focused()}, {keyFocusSkip()}, {keyFocusSkip()}));
    ASSERT_TRUE(root);

    root->focusTracker().next();
    EXPECT_EQ(activeId(*root), "A");
}

TEST(FocusTrackerTest, ProcessKeyDispatchesGlobalKeys) {
    auto root = mustCreate(threeLeaves({focused()}));
    ASSERT_TRUE(root);
    FocusTracker& focus = root->focusTracker();

    EXPECT_TRUE(focus.processKey(keys::Tab));
    EXPECT_EQ(activeId(*root), "B");
    EXPECT_TRUE(focus.processKey(keys::BackTab));
    EXPECT_EQ(activeId(*root), "A");
    EXPECT_FALSE(focus.processKey('x'));
    EXPECT_EQ(activeId(*root), "A");
}

TEST(FocusGroupTest, NavigatesWithinGroupIncludingSkippedLeaves) {
    auto root = mustCreate(threeLeaves(
        {keyFocusGroups({1}), focused()},
        {keyFocusGroups({2})},
        {keyFocusGroups({1}), keyFocusSkip()}));
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->configure({keyFocusGroupsNext('n', {1}), keyFocusGroupsPrevious('p', {1})}).isOk());
    FocusTracker& focus = root->focusTracker();

    EXPECT_TRUE(focus.processKey('n'));
    EXPECT_EQ(activeId(*root), "C");
    EXPECT_TRUE(focus.processKey('n'));
    EXPECT_EQ(activeId(*root), "A");
    EXPECT_TRUE(focus.processKey('p'));
    EXPECT_EQ(activeId(*root), "C");
}

TEST(FocusGroupTest, NoSharedGroupHasNoEffect) {
    auto root = mustCreate(threeLeaves(
        {keyFocusGroups({3})},
        {keyFocusGroups({1}), focused()},
        {keyFocusGroups({1})}));
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->configure({keyFocusGroupsNext('n', {3})}).isOk());

    EXPECT_TRUE(root->focusTracker().processKey('n'));
    EXPECT_EQ(activeId(*root), "B");
}

TEST(FocusGroupTest, TieBreakFollowsDeclarationOrder) {
    // B is in groups [2, 1], the key maps to {1, 2}: group 2 wins, so
    // focus goes to C (group 2) and not to A (group 1)
    auto root = mustCreate(threeLeaves(
        {keyFocusGroups({1})},
        {keyFocusGroups({2, 1}), focused()},
        {keyFocusGroups({2})}));
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->configure({keyFocusGroupsNext('g', {1, 2})}).isOk());

    root->focusTracker().processKey('g');
    EXPECT_EQ(activeId(*root), "C");
}

TEST(FocusGroupTest, TieBreakWithOtherOrder) {
    auto root = mustCreate(threeLeaves(
        {keyFocusGroups({1})},
        {keyFocusGroups({1, 2}), focused()},
        {keyFocusGroups({2})}));
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->configure({keyFocusGroupsNext('g', {1, 2})}).isOk());

    root->focusTracker().processKey('g');
    EXPECT_EQ(activeId(*root), "A");
}

TEST(FocusGroupTest, GlobalKeyTakesPrecedenceOverGroupKey) {
    auto root = mustCreate(threeLeaves({keyFocusGroups({1}), focused()}, {}, {keyFocusGroups({1})}));
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->configure({keyFocusGroupsNext(keys::Tab, {1})}).isOk());

    root->focusTracker().processKey(keys::Tab);
    EXPECT_EQ(activeId(*root), "B");
}

TEST(FocusPointerTest, FocusesDeepestContainerAtPoint) {
    auto root = mustCreate(threeLeaves());
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->resolve(Rect{0, 0, 20, 10}).isOk());
    FocusTracker& focus = root->focusTracker();

    // A spans x 0..9, B 10..14, C 15..19
    focus.focusAt(3, 3);
    EXPECT_EQ(activeId(*root), "A");
    focus.focusAt(12, 9);
    EXPECT_EQ(activeId(*root), "B");
    focus.focusAt(19, 0);
    EXPECT_EQ(activeId(*root), "C");
}

TEST(FocusPointerTest, PointInsideMarginFocusesParent) {
    auto root = mustCreate(threeLeaves({marginLeft(2)}));
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->resolve(Rect{0, 0, 20, 10}).isOk());

    root->focusTracker().focusAt(1, 5);
    EXPECT_EQ(activeId(*root), "root");
}

TEST(FocusPointerTest, PointOutsideTreeIsIgnored) {
    auto root = mustCreate(threeLeaves({focused()}));
    ASSERT_TRUE(root);
    ASSERT_TRUE(root->resolve(Rect{0, 0, 20, 10}).isOk());

    EXPECT_EQ(root->focusTracker().focusAt(25, 5), nullptr);
    EXPECT_EQ(activeId(*root), "A");
}
