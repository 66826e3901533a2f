#include "cleaning_planner/GoalSelector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

bool matches(const std::vector<Cell>& types, Cell cell) {
    return std::find(types.begin(), types.end(), cell) != types.end();
}

double cross(const Point2& o, const Point2& a, const Point2& b) {
    return (a.first - o.first) * (b.second - o.second) -
           (a.second - o.second) * (b.first - o.first);
}

double segmentDistance(const Point2& p, const Point2& a, const Point2& b) {
    const double dx = b.first - a.first;
    const double dy = b.second - a.second;
    const double len_sq = dx * dx + dy * dy;
    double t = 0.0;
    if (len_sq > 0.0) {
        t = ((p.first - a.first) * dx + (p.second - a.second) * dy) / len_sq;
        t = std::clamp(t, 0.0, 1.0);
    }
    const double px = a.first + t * dx - p.first;
    const double py = a.second + t * dy - p.second;
    return std::sqrt(px * px + py * py);
}

constexpr double kScoreEpsilon = 1e-9;

}  // namespace

std::vector<Position> ringCells(const GridModel& grid, const Position& center, int radius) {
    std::vector<Position> cells;
    if (radius == 0) {
        if (grid.inBounds(center)) cells.push_back(center);
        return cells;
    }
    const int r0 = center.first;
    const int c0 = center.second;
    auto add = [&](int r, int c) {
        if (grid.inBounds({r, c})) cells.emplace_back(r, c);
    };
    // 위 -> 오른쪽 -> 아래 -> 왼쪽
    for (int k = 0; k < radius; ++k) add(r0 - radius + k, c0 + k);
    for (int k = 0; k < radius; ++k) add(r0 + k, c0 + radius - k);
    for (int k = 0; k < radius; ++k) add(r0 + radius - k, c0 - k);
    for (int k = 0; k < radius; ++k) add(r0 - k, c0 - radius + k);
    return cells;
}

std::vector<Point2> convexHull(std::vector<Point2> points) {
    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());
    if (points.size() < 3) {
        return points;
    }

    std::vector<Point2> hull(2 * points.size());
    std::size_t k = 0;
    for (const auto& p : points) {
        while (k >= 2 && cross(hull[k - 2], hull[k - 1], p) <= 0.0) --k;
        hull[k++] = p;
    }
    const std::size_t lower = k + 1;
    for (std::size_t i = points.size() - 1; i-- > 0;) {
        while (k >= lower && cross(hull[k - 2], hull[k - 1], points[i]) <= 0.0) --k;
        hull[k++] = points[i];
    }
    hull.resize(k - 1);
    return hull;
}

double distanceToHullBoundary(const std::vector<Point2>& hull, const Point2& p) {
    if (hull.size() < 3) {
        return 0.0;
    }
    double best = std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < hull.size(); ++i) {
        const Point2& a = hull[i];
        const Point2& b = hull[(i + 1) % hull.size()];
        best = std::min(best, segmentDistance(p, a, b));
    }
    return best;
}

GoalSelector::GoalSelector(GoalSelectorConfig config) : config_(config) {}

std::optional<Position> GoalSelector::ringSearch(const GridModel& grid,
                                                 const Position& from,
                                                 const std::vector<Cell>& types,
                                                 const CellSet& excluded) const {
    const int max_radius = grid.rows() + grid.cols();
    for (int radius = 0; radius <= max_radius; ++radius) {
        for (const auto& pos : ringCells(grid, from, radius)) {
            if (matches(types, grid.cellAt(pos)) && excluded.count(pos) == 0) {
                return pos;
            }
        }
    }
    return std::nullopt;
}

std::optional<Position> GoalSelector::bestCell(const GridModel& grid,
                                               const Position& from,
                                               const std::vector<Cell>& types,
                                               const CellSet& excluded) const {
    auto nearest = ringSearch(grid, from, types, excluded);
    if (!nearest) {
        return std::nullopt;
    }

    const int nearest_dist = manhattanDistance(from, *nearest);
    std::vector<Position> candidates;
    for (int radius = nearest_dist; radius <= nearest_dist + config_.comparable_slack; ++radius) {
        for (const auto& pos : ringCells(grid, from, radius)) {
            if (matches(types, grid.cellAt(pos)) && excluded.count(pos) == 0) {
                candidates.push_back(pos);
            }
        }
    }
    if (candidates.size() < 2) {
        return nearest;
    }

    std::vector<Point2> points;
    for (const auto& pos : grid.cellsOf(types)) {
        if (excluded.count(pos) != 0) continue;
        points.emplace_back(pos.first, pos.second);
    }
    const auto hull = convexHull(std::move(points));

    // 점수가 같으면 먼저 나온 (링 순서) 후보 유지
    Position best = candidates.front();
    double best_score = std::numeric_limits<double>::max();
    for (const auto& pos : candidates) {
        const double depth = distanceToHullBoundary(hull, Point2(pos.first, pos.second));
        const double score = manhattanDistance(from, pos) - config_.hull_weight * depth;
        if (score < best_score - kScoreEpsilon) {
            best_score = score;
            best = pos;
        }
    }
    return best;
}

std::optional<Position> GoalSelector::garbageGoal(const GridModel& grid,
                                                  const Position& from,
                                                  int load,
                                                  int capacity,
                                                  const CellSet& excluded) const {
    if (load >= capacity) {
        return ringSearch(grid, from, {Cell::Bin}, excluded);
    }
    if (auto trash = bestCell(grid, from, {Cell::DryTrash, Cell::WetTrash}, excluded)) {
        return trash;
    }
    // 갈 수 있는 쓰레기가 없으면 실은 것부터 비운다
    if (load > 0) {
        return ringSearch(grid, from, {Cell::Bin}, excluded);
    }
    return std::nullopt;
}
