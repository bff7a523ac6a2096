#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "index/interval_tree.h"

#include <string>

using namespace sidx;
using ::testing::UnorderedElementsAre;
using ::testing::IsEmpty;

using Tree = IntervalTree<long, std::string>;

TEST(IntervalTreeTest, EmptyTreeFindsNothing) {
    Tree tree(std::vector<Tree::Interval>{});
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.intervalCount(), 0u);
    EXPECT_THAT(tree.search(0, 100), IsEmpty());
}

TEST(IntervalTreeTest, SearchIsInclusiveOnBothEnds) {
    Tree tree({{1, 10, "A"}, {11, 20, "B"}});

    EXPECT_THAT(tree.search(10, 10), UnorderedElementsAre("A"));
    EXPECT_THAT(tree.search(11, 11), UnorderedElementsAre("B"));
    EXPECT_THAT(tree.search(5, 15), UnorderedElementsAre("A", "B"));
    EXPECT_THAT(tree.search(1, 5), UnorderedElementsAre("A"));
    EXPECT_THAT(tree.search(21, 30), IsEmpty());
    EXPECT_THAT(tree.search(-5, 0), IsEmpty());
}

TEST(IntervalTreeTest, PointQueries) {
    Tree tree({{0, 100, "wide"}, {40, 60, "mid"}, {50, 50, "point"}, {70, 80, "right"}});

    EXPECT_THAT(tree.search(50L), UnorderedElementsAre("wide", "mid", "point"));
    EXPECT_THAT(tree.search(75L), UnorderedElementsAre("wide", "right"));
    EXPECT_THAT(tree.search(101L), IsEmpty());
}

TEST(IntervalTreeTest, CountsDuplicateIntervals) {
    Tree tree({{1, 5, "x"}, {1, 5, "y"}, {3, 9, "z"}});
    EXPECT_EQ(tree.intervalCount(), 3u);
    EXPECT_THAT(tree.search(4, 4), UnorderedElementsAre("x", "y", "z"));
}

TEST(IntervalTreeTest, RejectsInvertedInterval) {
    EXPECT_THROW(Tree({{10, 1, "bad"}}), std::invalid_argument);
}

TEST(IntervalTreeTest, CustomComparator) {
    IntervalTree<std::string, int> tree({{"apple", "banana", 1}, {"cherry", "grape", 2}});
    EXPECT_THAT(tree.search("b", "c"), UnorderedElementsAre(1));
    EXPECT_THAT(tree.search("d", "z"), UnorderedElementsAre(2));
}
