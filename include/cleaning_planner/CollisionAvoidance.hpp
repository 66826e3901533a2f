#pragma once

#include "cleaning_planner/GridModel.hpp"
#include "cleaning_planner/types.hpp"

#include <functional>
#include <optional>
#include <random>
#include <vector>

// 다른 에이전트가 보는 한 에이전트의 모습
struct AgentView {
    AgentKind kind;
    Position position;
    int priority;
    bool urgent;
};

struct ScoredStep {
    Position target;
    int score;  // 이동 후 다른 에이전트까지의 최소 (거리 + 우선순위)
};

struct CollisionAvoidanceConfig {
    int comfortable_separation{6};
    int crowded_separation{1};
};

using GoalDistanceFn = std::function<std::optional<int>(const Position&)>;

class CollisionAvoidance {
public:
    CollisionAvoidance(CollisionAvoidanceConfig config, std::mt19937& rng);

    // at 위치에서 다른 에이전트까지의 최소 (맨해튼 거리 + 상대 우선순위)
    int separation(const Position& at, const std::vector<AgentView>& others) const;

    // 제자리 + 4방향 중 갈 수 있는 후보와 점수. 벽, 범위 밖, 점유 칸 제외.
    std::vector<ScoredStep> scoreSteps(const GridModel& grid,
                                       const AgentView& self,
                                       const std::vector<AgentView>& others) const;

    // 목표 없는 에이전트의 회피. 충분히 떨어져 있으면 std::nullopt.
    std::optional<Position> evade(const GridModel& grid,
                                  const AgentView& self,
                                  const std::vector<AgentView>& others);

    // 목표를 향한 한 걸음. 붐비면 개인 공간 우선, 아니면 목표 거리 우선.
    Position chooseStep(const GridModel& grid,
                        const AgentView& self,
                        const std::vector<AgentView>& others,
                        const GoalDistanceFn& distance_to_goal);

    bool isCrowded(const AgentView& self, const std::vector<AgentView>& others) const;

private:
    CollisionAvoidanceConfig config_;
    std::mt19937& rng_;

    const ScoredStep& pickRandom(const std::vector<const ScoredStep*>& ties);
};
