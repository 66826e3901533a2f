#pragma once

#include "cleaning_planner/GridModel.hpp"
#include "cleaning_planner/types.hpp"

#include <optional>
#include <set>
#include <utility>
#include <vector>

using Point2 = std::pair<double, double>;  // (row, col) 셀 중심

// 후보에서 뺄 셀 (경로가 없다고 확인된 목표 등)
using CellSet = std::set<Position>;

struct GoalSelectorConfig {
    double hull_weight{0.5};     // 볼록 껍질 안쪽 깊이 가중치
    int comparable_slack{1};     // 최근접 거리 + slack 이내면 "비슷한 거리"
};

class GoalSelector {
public:
    explicit GoalSelector(GoalSelectorConfig config = {});

    // 맨해튼 반경을 넓혀 가며 처음 만나는 셀
    std::optional<Position> ringSearch(const GridModel& grid,
                                       const Position& from,
                                       const std::vector<Cell>& types,
                                       const CellSet& excluded = {}) const;

    // 거리가 비슷한 후보가 여럿이면 군집 안쪽 셀을 고른다
    std::optional<Position> bestCell(const GridModel& grid,
                                     const Position& from,
                                     const std::vector<Cell>& types,
                                     const CellSet& excluded = {}) const;

    // 적재량 < 용량: 쓰레기, 가득 참: 쓰레기통, 남은 후보 없음 + 적재 중: 쓰레기통
    std::optional<Position> garbageGoal(const GridModel& grid,
                                        const Position& from,
                                        int load,
                                        int capacity,
                                        const CellSet& excluded = {}) const;

    const GoalSelectorConfig& config() const { return config_; }

private:
    GoalSelectorConfig config_;
};

// center 에서 맨해튼 거리 radius 인 그리드 내부 셀.
// 바로 위 셀부터 시계 방향.
std::vector<Position> ringCells(const GridModel& grid, const Position& center, int radius);

// Andrew monotone chain. 반시계 방향, 일직선 위의 점은 제외.
std::vector<Point2> convexHull(std::vector<Point2> points);

// 껍질 경계까지의 유클리드 거리. 꼭짓점이 3개 미만이면 0.
double distanceToHullBoundary(const std::vector<Point2>& hull, const Point2& p);
