#pragma once

#include "cleaning_planner/AgentController.hpp"

#include <memory>
#include <string>

// "centralized" / "decentralized". 그 외는 std::invalid_argument.
std::unique_ptr<AgentController> makeController(const std::string& strategy,
                                                GridModel grid,
                                                const AgentLocations& starts,
                                                const ControllerConfig& config,
                                                std::mt19937 rng,
                                                rclcpp::Logger logger = rclcpp::get_logger("cleaning_planner"));
