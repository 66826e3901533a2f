#include "cleaning_planner/CleaningAgent.hpp"

#include <algorithm>
#include <sstream>

CleaningAgent::CleaningAgent(AgentKind kind, const Position& pos) : kind_(kind), pos_(pos) {}

std::optional<Position> CleaningAgent::selectGoal(const GridModel& grid,
                                                  const GoalSelector& selector,
                                                  const CellSet& excluded) const {
    return selector.bestCell(grid, pos_, targetCells(), excluded);
}

bool CleaningAgent::goalStillValid(const GridModel& grid) const {
    if (!goal_ || !grid.inBounds(*goal_)) return false;
    const auto types = targetCells();
    return std::find(types.begin(), types.end(), grid.cellAt(*goal_)) != types.end();
}

CleanupResult CleaningAgent::cleanUp(GridModel& grid) {
    const auto types = targetCells();
    if (std::find(types.begin(), types.end(), grid.cellAt(pos_)) == types.end()) {
        return CleanupResult::None;
    }
    return grid.cleanUp(pos_, kind_);
}

std::string CleaningAgent::describe() const {
    std::ostringstream oss;
    oss << toString(kind_) << " at " << toString(pos_);
    if (goal_) oss << " -> " << toString(*goal_);
    return oss.str();
}

// ========== GarbageCollectorAgent ==========

GarbageCollectorAgent::GarbageCollectorAgent(const Position& pos, int capacity)
    : CleaningAgent(AgentKind::GarbageCollector, pos), capacity_(capacity) {}

std::unique_ptr<CleaningAgent> GarbageCollectorAgent::clone() const {
    return std::make_unique<GarbageCollectorAgent>(*this);
}

void GarbageCollectorAgent::startReturn() {
    mode_ = Mode::ReturningToBin;
    clearGoal();
}

bool GarbageCollectorAgent::updateMode(const GridModel& grid) {
    int trash = grid.count(Cell::DryTrash) + grid.count(Cell::WetTrash);
    for (const auto& cell : unreachable_) {
        if (isTrash(grid.cellAt(cell))) --trash;
    }
    const bool trash_left = trash > 0;
    if (mode_ == Mode::Collecting && (isFull() || (load_ > 0 && !trash_left))) {
        startReturn();
        return true;
    }
    if (mode_ == Mode::ReturningToBin && load_ == 0) {
        mode_ = Mode::Collecting;
        clearGoal();
        return true;
    }
    return false;
}

std::vector<Cell> GarbageCollectorAgent::targetCells() const {
    if (mode_ == Mode::ReturningToBin) return {Cell::Bin};
    return {Cell::DryTrash, Cell::WetTrash};
}

std::optional<Position> GarbageCollectorAgent::selectGoal(const GridModel& grid,
                                                          const GoalSelector& selector,
                                                          const CellSet& excluded) const {
    // 모드가 이미 용량/소진 조건을 반영한다. 여기서는 정책대로만 고른다.
    return selector.garbageGoal(grid, pos_, mode_ == Mode::ReturningToBin ? capacity_ : load_, capacity_,
                                excluded);
}

CleanupResult GarbageCollectorAgent::cleanUp(GridModel& grid) {
    const Cell here = grid.cellAt(pos_);
    if (mode_ == Mode::ReturningToBin) {
        if (here != Cell::Bin) return CleanupResult::None;
        load_ = 0;
        mode_ = Mode::Collecting;
        clearGoal();
        return CleanupResult::Unloaded;
    }

    if (!isTrash(here) || isFull()) return CleanupResult::None;

    const CleanupResult result = grid.cleanUp(pos_, kind_);
    if (result == CleanupResult::Bagged) {
        ++load_;
        if (isFull()) startReturn();
    }
    return result;
}

std::string GarbageCollectorAgent::describe() const {
    std::ostringstream oss;
    oss << CleaningAgent::describe() << " (" << load_ << "/" << capacity_ << ", " << toString(mode_) << ")";
    return oss.str();
}

// ========== VacuumAgent / MopAgent ==========

VacuumAgent::VacuumAgent(const Position& pos) : CleaningAgent(AgentKind::Vacuum, pos) {}

std::unique_ptr<CleaningAgent> VacuumAgent::clone() const {
    return std::make_unique<VacuumAgent>(*this);
}

MopAgent::MopAgent(const Position& pos) : CleaningAgent(AgentKind::Mop, pos) {}

std::unique_ptr<CleaningAgent> MopAgent::clone() const {
    return std::make_unique<MopAgent>(*this);
}

std::unique_ptr<CleaningAgent> makeAgent(AgentKind kind, const Position& pos, int garbage_capacity) {
    switch (kind) {
        case AgentKind::GarbageCollector:
            return std::make_unique<GarbageCollectorAgent>(pos, garbage_capacity);
        case AgentKind::Vacuum:
            return std::make_unique<VacuumAgent>(pos);
        case AgentKind::Mop:
            return std::make_unique<MopAgent>(pos);
    }
    return nullptr;
}

std::string toString(GarbageCollectorAgent::Mode mode) {
    return mode == GarbageCollectorAgent::Mode::ReturningToBin ? "ReturningToBin" : "Collecting";
}
