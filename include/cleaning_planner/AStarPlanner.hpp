#pragma once

#include "cleaning_planner/GridModel.hpp"
#include "cleaning_planner/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

struct Node {
    int index;       // row * cols + col
    int g_val;
    int h_val;
    std::uint64_t seq;  // 삽입 순서 (동점 처리)

    int f_val() const { return g_val + h_val; }
};

class AStarPlanner {
public:
    explicit AStarPlanner(const GridModel& grid);

    // start -> goal 이동 목록.
    // start == goal 이면 빈 목록, 도달 불가/범위 밖이면 std::nullopt.
    std::optional<std::vector<Move>> findPath(const Position& start, const Position& goal);

    std::optional<int> pathLength(const Position& start, const Position& goal);

    // 마지막 findPath 호출에서 확장한 노드 수
    std::size_t lastExpansions() const { return last_expansions_; }

private:
    const GridModel& grid_;
    std::size_t last_expansions_{0};
};

// 경로를 셀 목록으로 펼친다 (start 포함)
std::vector<Position> applyMoves(const Position& start, const std::vector<Move>& moves);
