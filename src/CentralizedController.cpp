#include "cleaning_planner/CentralizedController.hpp"

void CentralizedController::stepAgent(CleaningAgent& agent) {
    agent.beginStep(grid_);

    if (followCommittedTrip(agent)) return;

    if (!refreshGoal(agent)) {
        idle(agent);
        return;
    }

    const Position goal = *agent.goal();
    if (agent.position() == goal) {
        arrive(agent);
        return;
    }

    auto path = planner_.findPath(agent.position(), goal);
    if (!path) {
        reportPlanningFailure(agent);
        return;
    }

    const Position next = applyMove(agent.position(), path->front());
    if (occupiedByOther(next, agent)) {
        agent.dropTrip();
        sidestep(agent, goal);
        return;
    }

    if (agent.holdsCommittedTrip()) {
        agent.commitTrip(*path);
        agent.popTripStep();
    }
    moveAgent(agent, next);
}

bool CentralizedController::followCommittedTrip(CleaningAgent& agent) {
    if (!agent.holdsCommittedTrip() || agent.committedTrip().empty()) return false;

    // 쓰레기통이 치워졌으면 경로를 버린다 (refreshGoal 이 새로 고른다)
    if (!agent.goalStillValid(grid_)) {
        agent.dropTrip();
        return false;
    }

    const Position next = applyMove(agent.position(), agent.committedTrip().front());
    if (!grid_.isWalkable(next) || occupiedByOther(next, agent)) {
        RCLCPP_DEBUG(logger_, "[%s] committed trip blocked at %s, replanning",
                     toString(agent.kind()).c_str(), toString(next).c_str());
        agent.dropTrip();
        return false;
    }

    agent.popTripStep();
    moveAgent(agent, next);
    return true;
}

void CentralizedController::sidestep(CleaningAgent& agent, const Position& goal) {
    const Position target = avoidance_.chooseStep(
        grid_, viewOf(agent), othersOf(agent),
        [this, &goal](const Position& p) { return planner_.pathLength(p, goal); });
    if (target != agent.position()) {
        moveAgent(agent, target);
    }
}
