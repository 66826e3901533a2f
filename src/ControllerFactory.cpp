#include "cleaning_planner/ControllerFactory.hpp"

#include "cleaning_planner/CentralizedController.hpp"
#include "cleaning_planner/DecentralizedController.hpp"

#include <stdexcept>
#include <utility>

std::unique_ptr<AgentController> makeController(const std::string& strategy,
                                                GridModel grid,
                                                const AgentLocations& starts,
                                                const ControllerConfig& config,
                                                std::mt19937 rng,
                                                rclcpp::Logger logger) {
    if (strategy == "centralized") {
        return std::make_unique<CentralizedController>(std::move(grid), starts, config, rng, logger);
    }
    if (strategy == "decentralized") {
        return std::make_unique<DecentralizedController>(std::move(grid), starts, config, rng, logger);
    }
    throw std::invalid_argument("알 수 없는 전략: " + strategy);
}
