#include "cleaning_planner/GridModel.hpp"

#include <gtest/gtest.h>

#include <random>
#include <stdexcept>

TEST(GridModelTest, GarbageCollectorLeavesResidue) {
    GridModel grid = GridModel::fromRows({"dw"});

    EXPECT_EQ(grid.cleanUp({0, 0}, AgentKind::GarbageCollector), CleanupResult::Bagged);
    EXPECT_EQ(grid.cleanUp({0, 1}, AgentKind::GarbageCollector), CleanupResult::Bagged);
    EXPECT_EQ(grid.cellAt({0, 0}), Cell::Dusty);
    EXPECT_EQ(grid.cellAt({0, 1}), Cell::Soaked);

    // 잔여물은 수거 에이전트가 다시 치우지 않는다
    EXPECT_EQ(grid.cleanUp({0, 0}, AgentKind::GarbageCollector), CleanupResult::None);
    EXPECT_EQ(grid.cellAt({0, 0}), Cell::Dusty);
}

TEST(GridModelTest, VacuumAndMopOnlyCleanTheirResidue) {
    GridModel grid = GridModel::fromRows({":~d"});

    EXPECT_EQ(grid.cleanUp({0, 1}, AgentKind::Vacuum), CleanupResult::None);
    EXPECT_EQ(grid.cleanUp({0, 2}, AgentKind::Vacuum), CleanupResult::None);
    EXPECT_EQ(grid.cleanUp({0, 0}, AgentKind::Mop), CleanupResult::None);

    EXPECT_EQ(grid.cleanUp({0, 0}, AgentKind::Vacuum), CleanupResult::Cleaned);
    EXPECT_EQ(grid.cleanUp({0, 1}, AgentKind::Mop), CleanupResult::Cleaned);
    EXPECT_EQ(grid.cellAt({0, 0}), Cell::Empty);
    EXPECT_EQ(grid.cellAt({0, 1}), Cell::Empty);
    EXPECT_EQ(grid.cellAt({0, 2}), Cell::DryTrash);
}

TEST(GridModelTest, WallsAndBinsAreNeverChanged) {
    GridModel grid = GridModel::fromRows({"#B"});
    for (AgentKind kind : kAgentOrder) {
        EXPECT_EQ(grid.cleanUp({0, 0}, kind), CleanupResult::None);
        EXPECT_EQ(grid.cleanUp({0, 1}, kind), CleanupResult::None);
    }
    EXPECT_EQ(grid.render(), "#B\n");
}

TEST(GridModelTest, CountsFollowEdits) {
    GridModel grid(4, 5);
    EXPECT_EQ(grid.count(Cell::Empty), 20);
    EXPECT_EQ(grid.hazardCount(), 0);

    std::mt19937 rng(7);
    std::uniform_int_distribution<int> row(0, 3), col(0, 4), kind(0, static_cast<int>(kCellTypeCount) - 1);
    for (int i = 0; i < 200; ++i) {
        grid.setCell({row(rng), col(rng)}, static_cast<Cell>(kind(rng)));
        if (i % 3 == 0) grid.cleanUp({row(rng), col(rng)}, kAgentOrder[(i / 3) % 3]);
    }

    int total = 0;
    for (std::size_t c = 0; c < kCellTypeCount; ++c) {
        const Cell cell = static_cast<Cell>(c);
        EXPECT_EQ(grid.count(cell), grid.scanCount(cell)) << toString(cell);
        total += grid.count(cell);
    }
    EXPECT_EQ(total, grid.area());
}

TEST(GridModelTest, WallRevisionMovesOnlyWithWalls) {
    GridModel grid = GridModel::fromRows({"d.#"});
    const auto start = grid.wallRevision();

    grid.setCell({0, 1}, Cell::Bin);
    grid.cleanUp({0, 0}, AgentKind::GarbageCollector);
    EXPECT_EQ(grid.wallRevision(), start);

    grid.setCell({0, 1}, Cell::Wall);
    EXPECT_EQ(grid.wallRevision(), start + 1);
    grid.setCell({0, 1}, Cell::Wall);
    EXPECT_EQ(grid.wallRevision(), start + 1);
    grid.setCell({0, 2}, Cell::Empty);
    EXPECT_EQ(grid.wallRevision(), start + 2);
}

TEST(GridModelTest, WalkabilityAndBounds) {
    GridModel grid = GridModel::fromRows({".#", "B~"});
    EXPECT_TRUE(grid.isWalkable({0, 0}));
    EXPECT_FALSE(grid.isWalkable({0, 1}));
    EXPECT_TRUE(grid.isWalkable({1, 0}));
    EXPECT_FALSE(grid.isWalkable({2, 0}));
    EXPECT_FALSE(grid.inBounds({-1, 0}));

    EXPECT_THROW(grid.cellAt({0, 2}), std::out_of_range);
    EXPECT_THROW(grid.setCell({5, 5}, Cell::Empty), std::out_of_range);
}

TEST(GridModelTest, CellsOfIsRowMajor) {
    GridModel grid = GridModel::fromRows({".d.", "w..", "..d"});
    const std::vector<Position> expected = {{0, 1}, {1, 0}, {2, 2}};
    EXPECT_EQ(grid.cellsOf({Cell::DryTrash, Cell::WetTrash}), expected);
    EXPECT_TRUE(grid.cellsOf({Cell::Bin}).empty());
}

TEST(GridModelTest, RejectsMalformedInput) {
    EXPECT_THROW(GridModel::fromRows({}), std::invalid_argument);
    EXPECT_THROW(GridModel::fromRows({"..", "."}), std::invalid_argument);
    EXPECT_THROW(GridModel::fromRows({".x"}), std::invalid_argument);
    EXPECT_THROW(GridModel(0, 3), std::invalid_argument);
}

TEST(GridModelTest, RenderMatchesCharacterMap) {
    const std::vector<std::string> rows = {"B.d#", "w:~."};
    GridModel grid = GridModel::fromRows(rows);
    EXPECT_EQ(grid.render(), "B.d#\nw:~.\n");
    EXPECT_EQ(grid.hazardCount(), 4);
}
