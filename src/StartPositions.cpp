#include "cleaning_planner/StartPositions.hpp"

#include "cleaning_planner/GoalSelector.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

namespace {

std::vector<Cell> affinityOf(AgentKind kind) {
    switch (kind) {
        case AgentKind::GarbageCollector: return {Cell::DryTrash, Cell::WetTrash};
        case AgentKind::Vacuum:           return {Cell::Dusty};
        case AgentKind::Mop:              return {Cell::Soaked};
    }
    return {};
}

Position nearestFree(const GridModel& grid, const Position& from, const std::set<Position>& used) {
    const int max_radius = grid.rows() + grid.cols();
    for (int radius = 0; radius <= max_radius; ++radius) {
        for (const auto& p : ringCells(grid, from, radius)) {
            if (grid.isWalkable(p) && used.count(p) == 0) return p;
        }
    }
    throw std::invalid_argument("에이전트를 둘 빈 칸이 없습니다.");
}

std::vector<Position> freeCells(const GridModel& grid, const std::vector<Cell>& types,
                                const std::set<Position>& used) {
    std::vector<Position> cells;
    for (const auto& p : grid.cellsOf(types)) {
        if (used.count(p) == 0) cells.push_back(p);
    }
    return cells;
}

}  // namespace

AgentLocations defaultStartPositions(const GridModel& grid) {
    const int last_row = grid.rows() - 1;
    const int last_col = grid.cols() - 1;
    const std::pair<AgentKind, Position> corners[] = {
        {AgentKind::GarbageCollector, {0, 0}},
        {AgentKind::Vacuum, {0, last_col}},
        {AgentKind::Mop, {last_row, 0}},
    };

    AgentLocations starts;
    std::set<Position> used;
    for (const auto& [kind, corner] : corners) {
        const Position p = nearestFree(grid, corner, used);
        used.insert(p);
        starts[kind] = p;
    }
    return starts;
}

AgentLocations randomStartPositions(const GridModel& grid, std::mt19937& rng) {
    const std::vector<Cell> walkable = {Cell::Empty, Cell::DryTrash, Cell::WetTrash,
                                        Cell::Dusty, Cell::Soaked, Cell::Bin};
    AgentLocations starts;
    std::set<Position> used;
    for (AgentKind kind : kAgentOrder) {
        auto candidates = freeCells(grid, affinityOf(kind), used);
        if (candidates.empty()) candidates = freeCells(grid, walkable, used);
        if (candidates.empty()) {
            throw std::invalid_argument("에이전트를 둘 빈 칸이 없습니다.");
        }
        std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
        const Position p = candidates[pick(rng)];
        used.insert(p);
        starts[kind] = p;
    }
    return starts;
}
