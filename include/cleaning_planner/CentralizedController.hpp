#pragma once

#include "cleaning_planner/AgentController.hpp"

// 매 틱 에이전트마다 전체 A* 경로를 다시 계획한다.
// 쓰레기통으로 돌아가는 수거 에이전트는 계획한 경로를 확정해 끝까지 따른다.
class CentralizedController : public AgentController {
public:
    using AgentController::AgentController;

    std::string strategyName() const override { return "Centralized"; }

protected:
    void stepAgent(CleaningAgent& agent) override;

private:
    // 확정된 경로의 다음 칸으로 갈 수 있으면 이동하고 true
    bool followCommittedTrip(CleaningAgent& agent);
    void sidestep(CleaningAgent& agent, const Position& goal);
};
