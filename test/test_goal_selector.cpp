#include "cleaning_planner/GoalSelector.hpp"

#include <gtest/gtest.h>

#include <algorithm>

TEST(RingCellsTest, ClockwiseFromStraightUp) {
    GridModel grid(5, 5);

    const std::vector<Position> radius1 = {{1, 2}, {2, 3}, {3, 2}, {2, 1}};
    EXPECT_EQ(ringCells(grid, {2, 2}, 1), radius1);

    const std::vector<Position> radius2 = {{0, 2}, {1, 3}, {2, 4}, {3, 3}, {4, 2}, {3, 1}, {2, 0}, {1, 1}};
    EXPECT_EQ(ringCells(grid, {2, 2}, 2), radius2);

    const std::vector<Position> center = {{2, 2}};
    EXPECT_EQ(ringCells(grid, {2, 2}, 0), center);
}

TEST(RingCellsTest, ClipsAtGridEdge) {
    GridModel grid(3, 3);
    const std::vector<Position> expected = {{0, 1}, {1, 0}};
    EXPECT_EQ(ringCells(grid, {0, 0}, 1), expected);
    EXPECT_TRUE(ringCells(grid, {0, 0}, 5).empty());
}

TEST(ConvexHullTest, DropsInteriorAndCollinearPoints) {
    auto hull = convexHull({{0, 0}, {0, 1}, {0, 2}, {1, 1}, {2, 0}, {2, 2}, {2, 2}});
    ASSERT_EQ(hull.size(), 4u);

    std::sort(hull.begin(), hull.end());
    const std::vector<Point2> corners = {{0, 0}, {0, 2}, {2, 0}, {2, 2}};
    EXPECT_EQ(hull, corners);
}

TEST(ConvexHullTest, SmallInputsPassThrough) {
    EXPECT_TRUE(convexHull({}).empty());
    EXPECT_EQ(convexHull({{1, 1}, {1, 1}}).size(), 1u);
    EXPECT_EQ(convexHull({{0, 0}, {3, 3}}).size(), 2u);
}

TEST(ConvexHullTest, BoundaryDistance) {
    const auto hull = convexHull({{0, 0}, {0, 4}, {4, 4}, {4, 0}});
    EXPECT_DOUBLE_EQ(distanceToHullBoundary(hull, {2, 2}), 2.0);
    EXPECT_DOUBLE_EQ(distanceToHullBoundary(hull, {1, 2}), 1.0);
    EXPECT_DOUBLE_EQ(distanceToHullBoundary(hull, {0, 2}), 0.0);

    // 꼭짓점이 3개 미만이면 깊이가 없다
    EXPECT_DOUBLE_EQ(distanceToHullBoundary({{0, 0}, {0, 4}}, {0, 2}), 0.0);
}

TEST(GoalSelectorTest, RingSearchPrefersClockwiseOrder) {
    GridModel grid = GridModel::fromRows({
        ".d.",
        "d..",
        "...",
    });
    GoalSelector selector;
    EXPECT_EQ(selector.ringSearch(grid, {0, 0}, {Cell::DryTrash}), Position(0, 1));
    EXPECT_EQ(selector.ringSearch(grid, {1, 1}, {Cell::DryTrash}), Position(0, 1));
    EXPECT_EQ(selector.ringSearch(grid, {2, 0}, {Cell::DryTrash}), Position(1, 0));
    EXPECT_FALSE(selector.ringSearch(grid, {0, 0}, {Cell::Soaked}).has_value());
}

TEST(GoalSelectorTest, RingSearchFindsOwnCell) {
    GridModel grid = GridModel::fromRows({"~.~"});
    GoalSelector selector;
    EXPECT_EQ(selector.ringSearch(grid, {0, 2}, {Cell::Soaked}), Position(0, 2));
}

TEST(GoalSelectorTest, RingSearchSkipsExcludedCells) {
    GridModel grid = GridModel::fromRows({
        ".d.",
        "d..",
        "...",
    });
    GoalSelector selector;
    EXPECT_EQ(selector.ringSearch(grid, {0, 0}, {Cell::DryTrash}, {{0, 1}}), Position(1, 0));
    EXPECT_FALSE(selector.ringSearch(grid, {0, 0}, {Cell::DryTrash}, {{0, 1}, {1, 0}}).has_value());
}

class BestCellTest : public ::testing::Test {
protected:
    // 3x3 쓰레기 덩어리, 에이전트는 왼쪽 끝
    GridModel grid_ = GridModel::fromRows({
        ".......",
        ".......",
        "...ddd.",
        "...ddd.",
        "...ddd.",
        ".......",
        ".......",
    });
    const Position from_{3, 0};
};

TEST_F(BestCellTest, DefaultWeightKeepsNearest) {
    GoalSelector selector;
    EXPECT_EQ(selector.bestCell(grid_, from_, {Cell::DryTrash}), Position(3, 3));
}

TEST_F(BestCellTest, HeavierWeightPullsTowardClusterCore) {
    GoalSelector selector(GoalSelectorConfig{2.0, 1});
    EXPECT_EQ(selector.bestCell(grid_, from_, {Cell::DryTrash}), Position(3, 4));
}

TEST_F(BestCellTest, ZeroSlackOnlyConsidersNearestRing) {
    GoalSelector selector(GoalSelectorConfig{2.0, 0});
    EXPECT_EQ(selector.bestCell(grid_, from_, {Cell::DryTrash}), Position(3, 3));
}

TEST_F(BestCellTest, NothingToClean) {
    GoalSelector selector;
    EXPECT_FALSE(selector.bestCell(grid_, from_, {Cell::Dusty}).has_value());
}

TEST_F(BestCellTest, ExcludedCellsLeaveCandidatesAndHull) {
    GoalSelector selector(GoalSelectorConfig{2.0, 1});
    // 가운데 열을 빼면 안쪽 후보가 없어 가장 가까운 셀로 돌아간다
    const CellSet middle = {{2, 4}, {3, 4}, {4, 4}};
    EXPECT_EQ(selector.bestCell(grid_, from_, {Cell::DryTrash}, middle), Position(3, 3));

    CellSet everything;
    for (const auto& pos : grid_.cellsOf({Cell::DryTrash})) everything.insert(pos);
    EXPECT_FALSE(selector.bestCell(grid_, from_, {Cell::DryTrash}, everything).has_value());
}

TEST(GoalSelectorTest, GarbagePolicy) {
    GridModel grid = GridModel::fromRows({
        "B...d",
        ".....",
        "....B",
    });
    GoalSelector selector;

    EXPECT_EQ(selector.garbageGoal(grid, {0, 1}, 0, 3), Position(0, 4));
    EXPECT_EQ(selector.garbageGoal(grid, {0, 1}, 2, 3), Position(0, 4));
    // 가득 차면 가장 가까운 쓰레기통
    EXPECT_EQ(selector.garbageGoal(grid, {0, 1}, 3, 3), Position(0, 0));
    EXPECT_EQ(selector.garbageGoal(grid, {1, 4}, 3, 3), Position(2, 4));

    // 남은 쓰레기가 전부 제외되면 적재분부터 비운다
    EXPECT_EQ(selector.garbageGoal(grid, {0, 1}, 1, 3, {{0, 4}}), Position(0, 0));
    EXPECT_FALSE(selector.garbageGoal(grid, {0, 1}, 0, 3, {{0, 4}}).has_value());
    EXPECT_EQ(selector.garbageGoal(grid, {0, 1}, 3, 3, {{0, 0}}), Position(2, 4));

    grid.setCell({0, 4}, Cell::Dusty);
    EXPECT_EQ(selector.garbageGoal(grid, {0, 1}, 1, 3), Position(0, 0));
    EXPECT_FALSE(selector.garbageGoal(grid, {0, 1}, 0, 3).has_value());
}
