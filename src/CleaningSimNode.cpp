#include "cleaning_planner/CleaningSimNode.hpp"

#include "cleaning_planner/ControllerFactory.hpp"
#include "cleaning_planner/Errors.hpp"
#include "cleaning_planner/StartPositions.hpp"

#include <chrono>
#include <random>
#include <stdexcept>
#include <utility>

std::int8_t occupancyValue(Cell cell) {
    switch (cell) {
        case Cell::Empty:    return 0;
        case Cell::DryTrash: return 10;
        case Cell::WetTrash: return 20;
        case Cell::Dusty:    return 30;
        case Cell::Soaked:   return 40;
        case Cell::Bin:      return 50;
        case Cell::Wall:     return 100;
    }
    return -1;
}

std::string topicName(AgentKind kind) {
    switch (kind) {
        case AgentKind::GarbageCollector: return "garbage_collector";
        case AgentKind::Vacuum:           return "vacuum";
        case AgentKind::Mop:              return "mop";
    }
    return "unknown";
}

CleaningSimNode::CleaningSimNode(const rclcpp::NodeOptions& options) : Node("cleaning_sim_node", options) {
    RCLCPP_INFO(get_logger(), "📌 Cleaning Sim Node 시작");

    initializeParameters();
    initializePublishers();

    const std::int64_t seed_param = get_parameter("seed").as_int();
    std::uint32_t seed = static_cast<std::uint32_t>(seed_param);
    if (seed_param == 0) {
        seed = std::random_device{}();
        RCLCPP_INFO(get_logger(), "🎲 seed 미지정, random_device 사용: %u", seed);
    }
    startRun(seed);
}

void CleaningSimNode::initializeParameters() {
    declare_parameter("strategy", std::string("centralized"));
    declare_parameter("rows", 10);
    declare_parameter("cols", 10);
    declare_parameter("fill_probability", 0.2);
    declare_parameter("wet_ratio", 0.5);
    declare_parameter("bin_count", 1);
    declare_parameter("wall_probability", 0.0);
    declare_parameter("seed", 0);
    declare_parameter("random_starts", false);
    declare_parameter("tick_period", 0.5);
    declare_parameter("resolution", 0.1);
    declare_parameter("garbage_capacity", 5);
    declare_parameter("comfortable_separation", 6);
    declare_parameter("crowded_separation", 1);
    declare_parameter("hull_weight", 0.5);
    declare_parameter("comparable_slack", 1);
    declare_parameter("watchdog_ticks_per_cell", 4);
    declare_parameter("restart_on_abort", false);

    strategy_ = get_parameter("strategy").as_string();

    grid_config_.rows = static_cast<int>(get_parameter("rows").as_int());
    grid_config_.cols = static_cast<int>(get_parameter("cols").as_int());
    grid_config_.fill_probability = get_parameter("fill_probability").as_double();
    grid_config_.wet_ratio = get_parameter("wet_ratio").as_double();
    grid_config_.bin_count = static_cast<int>(get_parameter("bin_count").as_int());
    grid_config_.wall_probability = get_parameter("wall_probability").as_double();

    controller_config_.garbage_capacity = static_cast<int>(get_parameter("garbage_capacity").as_int());
    controller_config_.avoidance.comfortable_separation =
        static_cast<int>(get_parameter("comfortable_separation").as_int());
    controller_config_.avoidance.crowded_separation =
        static_cast<int>(get_parameter("crowded_separation").as_int());
    controller_config_.goal_selection.hull_weight = get_parameter("hull_weight").as_double();
    controller_config_.goal_selection.comparable_slack =
        static_cast<int>(get_parameter("comparable_slack").as_int());
    controller_config_.watchdog_ticks_per_cell =
        static_cast<int>(get_parameter("watchdog_ticks_per_cell").as_int());

    random_starts_ = get_parameter("random_starts").as_bool();
    tick_period_ = get_parameter("tick_period").as_double();
    resolution_ = get_parameter("resolution").as_double();
    restart_on_abort_ = get_parameter("restart_on_abort").as_bool();

    RCLCPP_INFO(get_logger(), "🧭 전략: %s", strategy_.c_str());
    RCLCPP_INFO(get_logger(), "🗺️  그리드: %dx%d, 오염 확률 %.2f, 쓰레기통 %d개",
                grid_config_.rows, grid_config_.cols, grid_config_.fill_probability, grid_config_.bin_count);
    RCLCPP_INFO(get_logger(), "⏱️  틱 주기: %.2f초", tick_period_);

    if (strategy_ != "centralized" && strategy_ != "decentralized") {
        RCLCPP_ERROR(get_logger(), "❌ strategy 는 centralized 또는 decentralized 입니다");
        throw std::invalid_argument("알 수 없는 전략: " + strategy_);
    }
    if (tick_period_ <= 0.0) {
        RCLCPP_ERROR(get_logger(), "❌ tick_period 는 0보다 커야 합니다");
        throw std::invalid_argument("tick_period 가 유효하지 않습니다");
    }
    if (resolution_ <= 0.0) {
        RCLCPP_ERROR(get_logger(), "❌ resolution 은 0보다 커야 합니다");
        throw std::invalid_argument("resolution 이 유효하지 않습니다");
    }
    validate(grid_config_);
}

void CleaningSimNode::initializePublishers() {
    grid_pub_ = create_publisher<nav_msgs::msg::OccupancyGrid>("~/grid", 10);
    status_pub_ = create_publisher<std_msgs::msg::String>("~/status", 10);
    for (AgentKind kind : kAgentOrder) {
        pose_pubs_[kind] = create_publisher<geometry_msgs::msg::PoseStamped>("~/" + topicName(kind) + "/pose", 10);
    }
}

void CleaningSimNode::startRun(std::uint32_t seed) {
    if (timer_) timer_->cancel();
    seed_ = seed;

    std::mt19937 rng(seed_);
    GridModel grid = generateGrid(grid_config_, rng);
    const AgentLocations starts = random_starts_ ? randomStartPositions(grid, rng) : defaultStartPositions(grid);

    RCLCPP_INFO(get_logger(), "🚀 실행 시작 (seed %u), 오염 칸 %d개", seed_, grid.hazardCount());
    for (const auto& [kind, pos] : starts) {
        RCLCPP_INFO(get_logger(), "  %s: 시작 %s", toString(kind).c_str(), toString(pos).c_str());
    }

    controller_ = makeController(strategy_, std::move(grid), starts, controller_config_, rng,
                                 get_logger().get_child("controller"));
    publishState();

    timer_ = create_wall_timer(std::chrono::duration<double>(tick_period_), [this]() { onTick(); });
}

void CleaningSimNode::onTick() {
    try {
        controller_->tick();
    } catch (const WatchdogExpired& e) {
        timer_->cancel();
        RCLCPP_ERROR(get_logger(), "⏰ %s (seed %u)", e.what(), seed_);
        if (restart_on_abort_) {
            startRun(seed_ + 1);
        }
        return;
    } catch (const TickFault& e) {
        // 마지막 확정 상태로 되돌려진 채 멈춘다
        timer_->cancel();
        RCLCPP_ERROR(get_logger(), "❌ %s\n%s", e.what(), e.context().c_str());
        return;
    }

    publishState();

    if (controller_->finished()) {
        timer_->cancel();
        RCLCPP_INFO(get_logger(), "🎉 청소 완료: %zu 틱, 계획 실패 %zu회, 위반 %zu건",
                    controller_->tickCount(), controller_->planningFailures(), controller_->violations().size());
        RCLCPP_INFO(get_logger(), "최종 그리드:\n%s", controller_->grid().render().c_str());
    }
}

void CleaningSimNode::publishState() {
    publishGrid();
    publishPoses();
    publishStatus();
}

void CleaningSimNode::publishGrid() {
    const GridModel& grid = controller_->grid();

    nav_msgs::msg::OccupancyGrid msg;
    msg.header.stamp = now();
    msg.header.frame_id = "map";
    msg.info.resolution = static_cast<float>(resolution_);
    msg.info.width = static_cast<std::uint32_t>(grid.cols());
    msg.info.height = static_cast<std::uint32_t>(grid.rows());
    msg.info.origin.orientation.w = 1.0;

    msg.data.reserve(static_cast<std::size_t>(grid.area()));
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            msg.data.push_back(occupancyValue(grid.cellAt({r, c})));
        }
    }
    grid_pub_->publish(msg);
}

void CleaningSimNode::publishPoses() {
    const auto stamp = now();
    for (const auto& [kind, pos] : controller_->agentLocations()) {
        geometry_msgs::msg::PoseStamped msg;
        msg.header.stamp = stamp;
        msg.header.frame_id = "map";
        // 셀 중심 좌표
        msg.pose.position.x = (pos.second + 0.5) * resolution_;
        msg.pose.position.y = (pos.first + 0.5) * resolution_;
        msg.pose.orientation.w = 1.0;
        pose_pubs_.at(kind)->publish(msg);
    }
}

void CleaningSimNode::publishStatus() {
    std_msgs::msg::String msg;
    msg.data = controller_->describe();
    status_pub_->publish(msg);
}
