#include "cleaning_planner/GridGenerator.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

bool isProbability(double p) {
    return p >= 0.0 && p <= 1.0;
}

}  // namespace

void validate(const GridConfig& config) {
    if (config.rows <= 0 || config.cols <= 0) {
        throw std::invalid_argument("그리드 크기가 유효하지 않습니다: " + std::to_string(config.rows) + "x" +
                                    std::to_string(config.cols));
    }
    if (!isProbability(config.fill_probability) || !isProbability(config.wet_ratio) ||
        !isProbability(config.wall_probability)) {
        throw std::invalid_argument("확률 값은 [0, 1] 범위여야 합니다.");
    }
    if (config.bin_count < 0 || config.bin_count > config.rows * config.cols) {
        throw std::invalid_argument("쓰레기통 개수가 유효하지 않습니다: " + std::to_string(config.bin_count));
    }
}

GridModel generateGrid(const GridConfig& config, std::mt19937& rng) {
    validate(config);

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<std::vector<Cell>> cells(config.rows, std::vector<Cell>(config.cols, Cell::Empty));

    for (auto& row : cells) {
        for (auto& cell : row) {
            if (unit(rng) < config.wall_probability) {
                cell = Cell::Wall;
            } else if (unit(rng) < config.fill_probability) {
                cell = unit(rng) < config.wet_ratio ? Cell::WetTrash : Cell::DryTrash;
            }
        }
    }

    // 쓰레기통은 서로 다른 칸에. 벽 위에도 놓을 수 있다 (벽을 대체).
    std::vector<Position> all;
    all.reserve(static_cast<std::size_t>(config.rows) * config.cols);
    for (int r = 0; r < config.rows; ++r) {
        for (int c = 0; c < config.cols; ++c) all.emplace_back(r, c);
    }
    for (int i = 0; i < config.bin_count; ++i) {
        std::uniform_int_distribution<std::size_t> pick(static_cast<std::size_t>(i), all.size() - 1);
        std::swap(all[static_cast<std::size_t>(i)], all[pick(rng)]);
        const Position& p = all[static_cast<std::size_t>(i)];
        cells[p.first][p.second] = Cell::Bin;
    }

    return GridModel(std::move(cells));
}
