#include "cleaning_planner/GridModel.hpp"

#include <algorithm>
#include <stdexcept>

GridModel::GridModel(std::vector<std::vector<Cell>> cells) : cells_(std::move(cells)) {
    if (cells_.empty() || cells_[0].empty()) {
        throw std::invalid_argument("그리드가 비어 있습니다");
    }
    const std::size_t width = cells_[0].size();
    for (const auto& row : cells_) {
        if (row.size() != width) {
            throw std::invalid_argument("그리드 행 길이가 일정하지 않습니다");
        }
        for (Cell c : row) {
            counts_[static_cast<std::size_t>(c)]++;
        }
    }
}

GridModel::GridModel(int rows, int cols, Cell fill) {
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("그리드 크기는 1 이상이어야 합니다");
    }
    cells_.assign(rows, std::vector<Cell>(cols, fill));
    counts_[static_cast<std::size_t>(fill)] = rows * cols;
}

GridModel GridModel::fromRows(const std::vector<std::string>& rows) {
    std::vector<std::vector<Cell>> cells;
    cells.reserve(rows.size());
    for (const auto& line : rows) {
        std::vector<Cell> row;
        row.reserve(line.size());
        for (char c : line) {
            row.push_back(cellFromChar(c));
        }
        cells.push_back(std::move(row));
    }
    return GridModel(std::move(cells));
}

bool GridModel::inBounds(const Position& pos) const {
    return pos.first >= 0 && pos.second >= 0 &&
           pos.first < rows() && pos.second < cols();
}

bool GridModel::isWalkable(const Position& pos) const {
    return inBounds(pos) && cells_[pos.first][pos.second] != Cell::Wall;
}

void GridModel::checkBounds(const Position& pos) const {
    if (!inBounds(pos)) {
        throw std::out_of_range("그리드 범위 밖: " + toString(pos));
    }
}

Cell GridModel::cellAt(const Position& pos) const {
    checkBounds(pos);
    return cells_[pos.first][pos.second];
}

void GridModel::setCell(const Position& pos, Cell cell) {
    checkBounds(pos);
    Cell& slot = cells_[pos.first][pos.second];
    counts_[static_cast<std::size_t>(slot)]--;
    counts_[static_cast<std::size_t>(cell)]++;
    if ((slot == Cell::Wall) != (cell == Cell::Wall)) {
        ++wall_revision_;
    }
    slot = cell;
}

CleanupResult GridModel::cleanUp(const Position& pos, AgentKind acting_kind) {
    const Cell current = cellAt(pos);
    switch (acting_kind) {
        case AgentKind::GarbageCollector:
            // 쓰레기를 담고 나면 먼지/물기가 남는다
            if (current == Cell::DryTrash) {
                setCell(pos, Cell::Dusty);
                return CleanupResult::Bagged;
            }
            if (current == Cell::WetTrash) {
                setCell(pos, Cell::Soaked);
                return CleanupResult::Bagged;
            }
            break;
        case AgentKind::Vacuum:
            if (current == Cell::Dusty) {
                setCell(pos, Cell::Empty);
                return CleanupResult::Cleaned;
            }
            break;
        case AgentKind::Mop:
            if (current == Cell::Soaked) {
                setCell(pos, Cell::Empty);
                return CleanupResult::Cleaned;
            }
            break;
    }
    return CleanupResult::None;
}

int GridModel::hazardCount() const {
    return count(Cell::DryTrash) + count(Cell::WetTrash) +
           count(Cell::Dusty) + count(Cell::Soaked);
}

int GridModel::scanCount(Cell cell) const {
    int n = 0;
    for (const auto& row : cells_) {
        n += static_cast<int>(std::count(row.begin(), row.end(), cell));
    }
    return n;
}

std::vector<Position> GridModel::cellsOf(const std::vector<Cell>& types) const {
    std::vector<Position> found;
    for (int r = 0; r < rows(); ++r) {
        for (int c = 0; c < cols(); ++c) {
            const Cell cell = cells_[r][c];
            if (std::find(types.begin(), types.end(), cell) != types.end()) {
                found.emplace_back(r, c);
            }
        }
    }
    return found;
}

std::string GridModel::render() const {
    std::string out;
    out.reserve(static_cast<std::size_t>(rows()) * (cols() + 1));
    for (const auto& row : cells_) {
        for (Cell c : row) {
            out.push_back(toChar(c));
        }
        out.push_back('\n');
    }
    return out;
}
