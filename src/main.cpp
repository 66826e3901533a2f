#include "rclcpp/rclcpp.hpp"

#include "cleaning_planner/CleaningSimNode.hpp"

int main(int argc, char** argv) {
    rclcpp::init(argc, argv);

    RCLCPP_INFO(rclcpp::get_logger("main"), "🚀 Cleaning Planner 시작");

    auto node = std::make_shared<CleaningSimNode>();
    rclcpp::spin(node);
    rclcpp::shutdown();

    return 0;
}
