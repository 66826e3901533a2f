#pragma once

#include "cleaning_planner/GridModel.hpp"
#include "cleaning_planner/types.hpp"

#include <random>

// GarbageCollector 좌상단, Vacuum 우상단, Mop 좌하단.
// 벽이거나 이미 쓰인 칸이면 가장 가까운 빈 보행 가능 칸으로 옮긴다.
AgentLocations defaultStartPositions(const GridModel& grid);

// 에이전트 담당 셀 중 임의의 칸. 없으면 임의의 보행 가능 칸.
AgentLocations randomStartPositions(const GridModel& grid, std::mt19937& rng);
