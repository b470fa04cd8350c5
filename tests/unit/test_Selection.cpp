#include <gtest/gtest.h>
#include "sync/Selection.hpp"
#include "util/errors.hpp"

using namespace sb;
using namespace sb::sync;

namespace {

std::vector<int> five() { return {1, 2, 3, 4, 5}; }

}

TEST(SelectionTest, ExplicitListKeepsOnlyThosePositionsInOrder) {
    const auto p = IndexPredicate::parse("2,3");
    EXPECT_EQ(p.mode(), IndexPredicate::Mode::List);
    EXPECT_EQ(p.apply(five()), (std::vector<int>{2, 3}));
}

TEST(SelectionTest, ListOrderInTextDoesNotReorder) {
    EXPECT_EQ(IndexPredicate::parse("4, 1").apply(five()), (std::vector<int>{1, 4}));
}

TEST(SelectionTest, ListMayContainSpans) {
    EXPECT_EQ(IndexPredicate::parse("1,3-4").apply(five()), (std::vector<int>{1, 3, 4}));
}

TEST(SelectionTest, AllKeepsEverything) {
    EXPECT_EQ(IndexPredicate::parse("all").apply(five()), five());
    EXPECT_EQ(IndexPredicate::parse(" ALL ").apply(five()), five());
    EXPECT_EQ(IndexPredicate::all().apply(five()), five());
}

TEST(SelectionTest, BeforeAndAfterAreExclusive) {
    EXPECT_EQ(IndexPredicate::parse("<3").apply(five()), (std::vector<int>{1, 2}));
    EXPECT_EQ(IndexPredicate::parse(">3").apply(five()), (std::vector<int>{4, 5}));
    EXPECT_TRUE(IndexPredicate::before(1).apply(five()).empty());
    EXPECT_TRUE(IndexPredicate::after(5).apply(five()).empty());
}

TEST(SelectionTest, RangeIsInclusive) {
    const auto p = IndexPredicate::parse("2-4");
    EXPECT_EQ(p.mode(), IndexPredicate::Mode::Range);
    EXPECT_EQ(p.apply(five()), (std::vector<int>{2, 3, 4}));
    EXPECT_EQ(IndexPredicate::range(5, 5).apply(five()), (std::vector<int>{5}));
}

TEST(SelectionTest, PositionsPastTheEndSelectNothing) {
    EXPECT_EQ(IndexPredicate::parse("4-9").apply(five()), (std::vector<int>{4, 5}));
    EXPECT_TRUE(IndexPredicate::parse("7").apply(five()).empty());
}

TEST(SelectionTest, RejectsMalformedText) {
    for (const auto* bad : {"", "0", "-1", "3-1", "1,,2", "a", "<", ">x", "1-2-3", "2.5"})
        EXPECT_THROW(IndexPredicate::parse(bad), ValidationError) << bad;
}

TEST(SelectionTest, RendersCanonicalText) {
    EXPECT_EQ(IndexPredicate::parse("all").str(), "all");
    EXPECT_EQ(IndexPredicate::parse("<3").str(), "<3");
    EXPECT_EQ(IndexPredicate::parse(">2").str(), ">2");
    EXPECT_EQ(IndexPredicate::parse("2-4").str(), "2-4");
    EXPECT_EQ(IndexPredicate::parse("1, 3-5").str(), "1,3-5");
}

TEST(SelectionTest, FixedSelectorReturnsItsPredicate) {
    FixedSelector selector(IndexPredicate::parse("2,3"));
    const auto p = selector.select({});
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->str(), "2,3");
}
