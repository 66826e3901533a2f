#pragma once

#include "cleaning_planner/AStarPlanner.hpp"
#include "cleaning_planner/CleaningAgent.hpp"
#include "cleaning_planner/CollisionAvoidance.hpp"
#include "cleaning_planner/GoalSelector.hpp"
#include "cleaning_planner/GridModel.hpp"
#include "cleaning_planner/types.hpp"

#include "rclcpp/rclcpp.hpp"

#include <memory>
#include <random>
#include <string>
#include <vector>

struct ControllerConfig {
    int garbage_capacity{5};
    CollisionAvoidanceConfig avoidance;
    GoalSelectorConfig goal_selection;
    int watchdog_ticks_per_cell{4};
    int watchdog_min_ticks{64};
};

enum class ViolationKind {
    Overflow,
    Collision,
    Bookkeeping
};

struct Violation {
    ViolationKind kind;
    std::size_t tick;
    std::string message;
};

std::string toString(ViolationKind kind);

// 두 전략(Centralized / Decentralized)이 공유하는 계약
class AgentController {
public:
    AgentController(GridModel grid,
                    const AgentLocations& starts,
                    ControllerConfig config,
                    std::mt19937 rng,
                    rclcpp::Logger logger = rclcpp::get_logger("cleaning_planner"));
    virtual ~AgentController() = default;

    AgentController(const AgentController&) = delete;
    AgentController& operator=(const AgentController&) = delete;

    // 한 스텝 진행. 실패 시 마지막 확정 상태로 되돌리고 TickFault,
    // 틱 상한 초과 시 WatchdogExpired.
    void tick();

    AgentLocations agentLocations() const;
    bool finished() const;
    std::string describe() const;

    virtual std::string strategyName() const = 0;

    std::size_t tickCount() const { return ticks_; }
    std::size_t tickLimit() const { return tick_limit_; }
    std::size_t planningFailures() const { return planning_failures_; }
    const std::vector<Violation>& violations() const { return violations_; }

    // 틱 사이의 외부 편집용
    GridModel& grid() { return grid_; }
    const GridModel& grid() const { return grid_; }

    const CleaningAgent* agent(AgentKind kind) const;
    const GarbageCollectorAgent* garbageCollector() const;

protected:
    // kAgentOrder 순서로 한 에이전트씩 호출된다
    virtual void stepAgent(CleaningAgent& agent) = 0;

    // 캐시된 목표를 재검증하고 없으면 새로 고른다. 목표가 있으면 true.
    bool refreshGoal(CleaningAgent& agent);

    AgentView viewOf(const CleaningAgent& agent) const;
    std::vector<AgentView> othersOf(const CleaningAgent& agent) const;
    bool occupiedByOther(const Position& pos, const CleaningAgent& self) const;

    // 이동 후 발밑 청소, 목표 도달 처리
    void moveAgent(CleaningAgent& agent, const Position& target);
    void arrive(CleaningAgent& agent);

    // 목표 없는 에이전트가 붐비면 비켜 준다
    void idle(CleaningAgent& agent);

    // 목표를 도달 불가로 기록하고 버린다
    void reportPlanningFailure(CleaningAgent& agent);

    GridModel grid_;
    ControllerConfig config_;
    std::mt19937 rng_;
    rclcpp::Logger logger_;
    AStarPlanner planner_;
    GoalSelector selector_;
    CollisionAvoidance avoidance_;
    std::vector<std::unique_ptr<CleaningAgent>> agents_;

private:
    std::size_t ticks_{0};
    std::size_t tick_limit_;
    std::size_t planning_failures_{0};
    unsigned long seen_wall_revision_{0};
    mutable std::vector<Violation> violations_;
    mutable std::size_t last_bookkeeping_tick_{static_cast<std::size_t>(-1)};

    void checkInvariants();
    void recordViolation(ViolationKind kind, const std::string& message) const;
    std::vector<std::unique_ptr<CleaningAgent>> cloneAgents() const;
};
