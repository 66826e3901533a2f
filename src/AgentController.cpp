#include "cleaning_planner/AgentController.hpp"

#include "cleaning_planner/Errors.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

std::string toString(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::Overflow:    return "Overflow";
        case ViolationKind::Collision:   return "Collision";
        case ViolationKind::Bookkeeping: return "Bookkeeping";
    }
    return "Unknown";
}

AgentController::AgentController(GridModel grid,
                                 const AgentLocations& starts,
                                 ControllerConfig config,
                                 std::mt19937 rng,
                                 rclcpp::Logger logger)
    : grid_(std::move(grid)),
      config_(config),
      rng_(rng),
      logger_(logger),
      planner_(grid_),
      selector_(config_.goal_selection),
      avoidance_(config_.avoidance, rng_) {
    if (config_.garbage_capacity < 1) {
        throw std::invalid_argument("garbage_capacity 는 1 이상이어야 합니다.");
    }
    if (starts.empty()) {
        throw std::invalid_argument("에이전트가 하나도 없습니다.");
    }

    std::set<Position> used;
    for (AgentKind kind : kAgentOrder) {
        auto it = starts.find(kind);
        if (it == starts.end()) continue;

        const Position& pos = it->second;
        if (!grid_.isWalkable(pos)) {
            throw std::invalid_argument(toString(kind) + " 시작 위치 " + toString(pos) + " 가 벽이거나 범위 밖입니다.");
        }
        if (!used.insert(pos).second) {
            throw std::invalid_argument("시작 위치가 겹칩니다: " + toString(pos));
        }
        agents_.push_back(makeAgent(kind, pos, config_.garbage_capacity));
    }

    const long per_cell = static_cast<long>(config_.watchdog_ticks_per_cell) * grid_.area();
    tick_limit_ = static_cast<std::size_t>(std::max<long>(per_cell, config_.watchdog_min_ticks));
    seen_wall_revision_ = grid_.wallRevision();

    RCLCPP_DEBUG(logger_, "%zu agents on %dx%d grid, tick limit %zu",
                 agents_.size(), grid_.rows(), grid_.cols(), tick_limit_);
}

void AgentController::tick() {
    if (ticks_ >= tick_limit_ && !finished()) {
        RCLCPP_ERROR(logger_, "watchdog expired after %zu ticks: %s", ticks_, describe().c_str());
        throw WatchdogExpired(tick_limit_);
    }

    // 벽이 바뀌었으면 예전에 막혔던 목표도 다시 후보로
    if (grid_.wallRevision() != seen_wall_revision_) {
        seen_wall_revision_ = grid_.wallRevision();
        for (auto& agent : agents_) {
            agent->forgetUnreachable();
        }
    }

    // 실패하면 이 스냅샷으로 되돌린다
    GridModel grid_snapshot = grid_;
    auto agents_snapshot = cloneAgents();
    const std::mt19937 rng_snapshot = rng_;
    const std::size_t failures_snapshot = planning_failures_;

    try {
        for (auto& agent : agents_) {
            stepAgent(*agent);
        }
    } catch (const std::exception& e) {
        grid_ = std::move(grid_snapshot);
        agents_ = std::move(agents_snapshot);
        rng_ = rng_snapshot;
        planning_failures_ = failures_snapshot;
        const std::string context = describe();
        RCLCPP_ERROR(logger_, "tick %zu rolled back: %s | %s", ticks_ + 1, e.what(), context.c_str());
        throw TickFault(ticks_ + 1, e.what(), context);
    }

    ++ticks_;
    checkInvariants();
}

AgentLocations AgentController::agentLocations() const {
    AgentLocations locations;
    for (const auto& agent : agents_) {
        locations[agent->kind()] = agent->position();
    }
    return locations;
}

bool AgentController::finished() const {
    if (grid_.hazardCount() != 0) return false;
    for (const auto& agent : agents_) {
        if (agent->hasPendingWork()) return false;
    }

    // 카운트가 0이라고 해도 전체 스캔으로 한 번 더 확인
    int scanned = 0;
    for (Cell cell : {Cell::DryTrash, Cell::WetTrash, Cell::Dusty, Cell::Soaked}) {
        scanned += grid_.scanCount(cell);
    }
    if (scanned != 0) {
        if (last_bookkeeping_tick_ != ticks_) {
            last_bookkeeping_tick_ = ticks_;
            recordViolation(ViolationKind::Bookkeeping,
                            "hazard count is 0 but scan found " + std::to_string(scanned));
        }
        return false;
    }
    return true;
}

std::string AgentController::describe() const {
    std::ostringstream oss;
    oss << strategyName() << " (tick " << ticks_ << "): ";
    for (std::size_t i = 0; i < agents_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << agents_[i]->describe();
    }
    oss << "; hazards=" << grid_.hazardCount();
    return oss.str();
}

const CleaningAgent* AgentController::agent(AgentKind kind) const {
    for (const auto& a : agents_) {
        if (a->kind() == kind) return a.get();
    }
    return nullptr;
}

const GarbageCollectorAgent* AgentController::garbageCollector() const {
    return static_cast<const GarbageCollectorAgent*>(agent(AgentKind::GarbageCollector));
}

bool AgentController::refreshGoal(CleaningAgent& agent) {
    if (agent.goal() && !agent.goalStillValid(grid_)) {
        RCLCPP_DEBUG(logger_, "[%s] goal %s no longer valid", toString(agent.kind()).c_str(),
                     toString(*agent.goal()).c_str());
        agent.clearGoal();
    }
    if (!agent.goal()) {
        agent.setGoal(agent.selectGoal(grid_, selector_, agent.unreachable()));
    }
    // 남은 일이 모두 막혀 있으면 다시 시도한다 (매 틱 실패로 집계)
    if (!agent.goal() && !agent.unreachable().empty()) {
        agent.setGoal(agent.selectGoal(grid_, selector_, CellSet{}));
    }
    return agent.goal().has_value();
}

AgentView AgentController::viewOf(const CleaningAgent& agent) const {
    return AgentView{agent.kind(), agent.position(), agent.priority(), agent.isUrgent()};
}

std::vector<AgentView> AgentController::othersOf(const CleaningAgent& agent) const {
    std::vector<AgentView> others;
    for (const auto& a : agents_) {
        if (a.get() != &agent) others.push_back(viewOf(*a));
    }
    return others;
}

bool AgentController::occupiedByOther(const Position& pos, const CleaningAgent& self) const {
    for (const auto& a : agents_) {
        if (a.get() != &self && a->position() == pos) return true;
    }
    return false;
}

void AgentController::moveAgent(CleaningAgent& agent, const Position& target) {
    if (!grid_.isWalkable(target) || occupiedByOther(target, agent)) {
        throw std::logic_error(toString(agent.kind()) + " 이동 불가 칸 " + toString(target));
    }
    agent.setPosition(target);
    arrive(agent);
}

void AgentController::arrive(CleaningAgent& agent) {
    const Position here = agent.position();
    const CleanupResult result = agent.cleanUp(grid_);
    if (result != CleanupResult::None) {
        RCLCPP_DEBUG(logger_, "[%s] %s at %s", toString(agent.kind()).c_str(),
                     result == CleanupResult::Bagged    ? "bagged"
                     : result == CleanupResult::Cleaned ? "cleaned"
                                                        : "unloaded",
                     toString(here).c_str());
    }
    if (agent.goal() && *agent.goal() == here) {
        agent.clearGoal();
    }
}

void AgentController::idle(CleaningAgent& agent) {
    const auto target = avoidance_.evade(grid_, viewOf(agent), othersOf(agent));
    if (target && *target != agent.position()) {
        moveAgent(agent, *target);
    }
}

void AgentController::reportPlanningFailure(CleaningAgent& agent) {
    ++planning_failures_;
    RCLCPP_WARN(logger_, "[%s] no path from %s to %s, dropping goal", toString(agent.kind()).c_str(),
                toString(agent.position()).c_str(),
                agent.goal() ? toString(*agent.goal()).c_str() : "-");
    if (agent.goal()) {
        agent.markUnreachable(*agent.goal());
    }
    agent.clearGoal();
}

void AgentController::checkInvariants() {
    for (std::size_t i = 0; i < agents_.size(); ++i) {
        for (std::size_t j = i + 1; j < agents_.size(); ++j) {
            if (agents_[i]->position() == agents_[j]->position()) {
                recordViolation(ViolationKind::Collision,
                                toString(agents_[i]->kind()) + " and " + toString(agents_[j]->kind()) +
                                    " share " + toString(agents_[i]->position()));
            }
        }
    }
    if (const auto* gc = garbageCollector()) {
        if (gc->load() > gc->capacity()) {
            recordViolation(ViolationKind::Overflow,
                            "load " + std::to_string(gc->load()) + " exceeds capacity " +
                                std::to_string(gc->capacity()));
        }
    }
}

void AgentController::recordViolation(ViolationKind kind, const std::string& message) const {
    RCLCPP_ERROR(logger_, "%s violation at tick %zu: %s", toString(kind).c_str(), ticks_, message.c_str());
    violations_.push_back(Violation{kind, ticks_, message});
}

std::vector<std::unique_ptr<CleaningAgent>> AgentController::cloneAgents() const {
    std::vector<std::unique_ptr<CleaningAgent>> copy;
    copy.reserve(agents_.size());
    for (const auto& a : agents_) {
        copy.push_back(a->clone());
    }
    return copy;
}
