#pragma once

#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/pose_stamped.hpp"
#include "nav_msgs/msg/occupancy_grid.hpp"
#include "std_msgs/msg/string.hpp"

#include "cleaning_planner/AgentController.hpp"
#include "cleaning_planner/GridGenerator.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

class CleaningSimNode : public rclcpp::Node {
public:
    explicit CleaningSimNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

private:
    std::unique_ptr<AgentController> controller_;

    // 파라미터
    std::string strategy_;
    GridConfig grid_config_;
    ControllerConfig controller_config_;
    std::uint32_t seed_{0};
    bool random_starts_{false};
    double tick_period_;
    double resolution_;
    bool restart_on_abort_{false};

    // ROS2 통신
    rclcpp::Publisher<nav_msgs::msg::OccupancyGrid>::SharedPtr grid_pub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr status_pub_;
    std::map<AgentKind, rclcpp::Publisher<geometry_msgs::msg::PoseStamped>::SharedPtr> pose_pubs_;
    rclcpp::TimerBase::SharedPtr timer_;

    void initializeParameters();
    void initializePublishers();

    // seed 로 그리드와 시작 위치를 만들고 타이머를 건다
    void startRun(std::uint32_t seed);
    void onTick();

    void publishState();
    void publishGrid();
    void publishPoses();
    void publishStatus();
};

// OccupancyGrid 값: 벽 100, 빈칸 0, 오염 10..40, 쓰레기통 50
std::int8_t occupancyValue(Cell cell);

// ROS 토픽 이름에 쓰는 소문자 이름 (garbage_collector, vacuum, mop)
std::string topicName(AgentKind kind);
