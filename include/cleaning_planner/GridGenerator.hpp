#pragma once

#include "cleaning_planner/GridModel.hpp"

#include <random>

struct GridConfig {
    int rows{10};
    int cols{10};
    double fill_probability{0.2};  // 빈칸이 쓰레기가 될 확률
    double wet_ratio{0.5};         // 쓰레기 중 WetTrash 비율
    int bin_count{1};
    double wall_probability{0.0};
};

// 잘못된 설정은 std::invalid_argument
void validate(const GridConfig& config);

GridModel generateGrid(const GridConfig& config, std::mt19937& rng);
