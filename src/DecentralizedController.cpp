#include "cleaning_planner/DecentralizedController.hpp"

void DecentralizedController::stepAgent(CleaningAgent& agent) {
    agent.beginStep(grid_);

    if (!refreshGoal(agent)) {
        idle(agent);
        return;
    }

    const Position goal = *agent.goal();
    if (agent.position() == goal) {
        arrive(agent);
        return;
    }

    // 지금 자리에서 목표에 닿을 수 없으면 다음 틱에 다시 고른다
    if (!planner_.pathLength(agent.position(), goal)) {
        reportPlanningFailure(agent);
        return;
    }

    const Position target = avoidance_.chooseStep(
        grid_, viewOf(agent), othersOf(agent),
        [this, &goal](const Position& p) { return planner_.pathLength(p, goal); });
    if (target != agent.position()) {
        moveAgent(agent, target);
    }
}
