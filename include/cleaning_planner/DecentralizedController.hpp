#pragma once

#include "cleaning_planner/AgentController.hpp"

// 공유 계획 없이 각 에이전트가 이웃 칸 점수만 보고 한 칸씩 움직인다
class DecentralizedController : public AgentController {
public:
    using AgentController::AgentController;

    std::string strategyName() const override { return "Decentralized"; }

protected:
    void stepAgent(CleaningAgent& agent) override;
};
