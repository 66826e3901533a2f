#include "cleaning_planner/AStarPlanner.hpp"

#include <gtest/gtest.h>

TEST(AStarPlannerTest, OpenGridPathIsManhattan) {
    GridModel grid(6, 7);
    AStarPlanner planner(grid);

    for (int r0 = 0; r0 < grid.rows(); r0 += 2) {
        for (int c0 = 0; c0 < grid.cols(); c0 += 3) {
            for (int r1 = 0; r1 < grid.rows(); ++r1) {
                for (int c1 = 0; c1 < grid.cols(); ++c1) {
                    const Position start{r0, c0}, goal{r1, c1};
                    auto path = planner.findPath(start, goal);
                    ASSERT_TRUE(path.has_value());
                    EXPECT_EQ(static_cast<int>(path->size()), manhattanDistance(start, goal));
                    EXPECT_EQ(applyMoves(start, *path).back(), goal);
                }
            }
        }
    }
}

TEST(AStarPlannerTest, TiesFollowMoveOrder) {
    GridModel grid(3, 3);
    AStarPlanner planner(grid);

    auto path = planner.findPath({0, 0}, {2, 2});
    ASSERT_TRUE(path.has_value());
    const std::vector<Move> expected = {Move::Down, Move::Down, Move::Right, Move::Right};
    EXPECT_EQ(*path, expected);

    // 같은 입력은 항상 같은 경로
    EXPECT_EQ(planner.findPath({0, 0}, {2, 2}), path);
}

TEST(AStarPlannerTest, RoutesAroundWalls) {
    GridModel grid = GridModel::fromRows({
        ".....",
        "####.",
        ".....",
    });
    AStarPlanner planner(grid);

    auto path = planner.findPath({0, 0}, {2, 0});
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 10u);
    for (const auto& cell : applyMoves({0, 0}, *path)) {
        EXPECT_TRUE(grid.isWalkable(cell));
    }
}

TEST(AStarPlannerTest, SeparatedGoalFailsWithoutThrowing) {
    GridModel grid = GridModel::fromRows({
        ".#d",
        ".#.",
        ".#.",
    });
    AStarPlanner planner(grid);

    std::optional<std::vector<Move>> path;
    EXPECT_NO_THROW(path = planner.findPath({0, 0}, {0, 2}));
    EXPECT_FALSE(path.has_value());
    EXPECT_FALSE(planner.pathLength({0, 0}, {0, 2}).has_value());
    // 왼쪽 영역만 확장하고 끝난다
    EXPECT_EQ(planner.lastExpansions(), 3u);
}

TEST(AStarPlannerTest, DegenerateRequests) {
    GridModel grid = GridModel::fromRows({"B.d", "...", "..#"});
    AStarPlanner planner(grid);

    auto same = planner.findPath({1, 1}, {1, 1});
    ASSERT_TRUE(same.has_value());
    EXPECT_TRUE(same->empty());

    EXPECT_FALSE(planner.findPath({0, 0}, {2, 2}).has_value());   // 벽
    EXPECT_FALSE(planner.findPath({0, 0}, {3, 0}).has_value());   // 범위 밖
    EXPECT_FALSE(planner.findPath({-1, 0}, {0, 0}).has_value());

    auto path = planner.findPath({0, 0}, {0, 2});
    ASSERT_TRUE(path.has_value());
    const std::vector<Move> expected = {Move::Right, Move::Right};
    EXPECT_EQ(*path, expected);
    EXPECT_EQ(planner.pathLength({0, 0}, {0, 2}), 2);
}

TEST(AStarPlannerTest, SeesGridEditsThroughReference) {
    GridModel grid(1, 3);
    AStarPlanner planner(grid);
    EXPECT_TRUE(planner.findPath({0, 0}, {0, 2}).has_value());

    grid.setCell({0, 1}, Cell::Wall);
    EXPECT_FALSE(planner.findPath({0, 0}, {0, 2}).has_value());
}
