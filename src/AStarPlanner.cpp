#include "cleaning_planner/AStarPlanner.hpp"

#include <algorithm>
#include <limits>
#include <queue>

AStarPlanner::AStarPlanner(const GridModel& grid) : grid_(grid) {}

std::optional<std::vector<Move>> AStarPlanner::findPath(const Position& start, const Position& goal) {
    last_expansions_ = 0;

    // 출발점은 벽이어도 된다 (외부 편집으로 발밑이 벽이 된 경우)
    if (!grid_.inBounds(start) || !grid_.isWalkable(goal)) {
        return std::nullopt;
    }
    if (start == goal) {
        return std::vector<Move>{};
    }

    const int cols = grid_.cols();
    const int area = grid_.area();
    auto to_index = [cols](const Position& p) { return p.first * cols + p.second; };
    auto to_pos = [cols](int idx) { return Position{idx / cols, idx % cols}; };

    auto cmp = [](const Node& a, const Node& b) {
        if (a.f_val() != b.f_val()) return a.f_val() > b.f_val();
        return a.seq > b.seq;
    };
    std::priority_queue<Node, std::vector<Node>, decltype(cmp)> open_list(cmp);

    std::vector<int> g_score(area, std::numeric_limits<int>::max());
    std::vector<int> came_from(area, -1);
    std::vector<Move> came_move(area, Move::Up);
    std::vector<char> closed(area, 0);

    const int start_idx = to_index(start);
    const int goal_idx = to_index(goal);
    std::uint64_t seq = 0;

    g_score[start_idx] = 0;
    open_list.push(Node{start_idx, 0, manhattanDistance(start, goal), seq++});

    while (!open_list.empty()) {
        Node curr = open_list.top();
        open_list.pop();

        // decrease-key 대신 오래된 항목은 건너뛴다
        if (closed[curr.index] || curr.g_val > g_score[curr.index]) continue;
        closed[curr.index] = 1;
        ++last_expansions_;

        if (curr.index == goal_idx) {
            std::vector<Move> path;
            for (int idx = goal_idx; idx != start_idx; idx = came_from[idx]) {
                path.push_back(came_move[idx]);
            }
            std::reverse(path.begin(), path.end());
            return path;
        }

        const Position pos = to_pos(curr.index);
        for (Move move : kMoveOrder) {
            const Position next = applyMove(pos, move);
            if (!grid_.isWalkable(next)) continue;

            const int next_idx = to_index(next);
            if (closed[next_idx]) continue;

            const int g = curr.g_val + 1;
            if (g >= g_score[next_idx]) continue;

            g_score[next_idx] = g;
            came_from[next_idx] = curr.index;
            came_move[next_idx] = move;
            open_list.push(Node{next_idx, g, manhattanDistance(next, goal), seq++});
        }
    }

    return std::nullopt;
}

std::optional<int> AStarPlanner::pathLength(const Position& start, const Position& goal) {
    auto path = findPath(start, goal);
    if (!path) return std::nullopt;
    return static_cast<int>(path->size());
}

std::vector<Position> applyMoves(const Position& start, const std::vector<Move>& moves) {
    std::vector<Position> cells;
    cells.reserve(moves.size() + 1);
    cells.push_back(start);
    Position curr = start;
    for (Move m : moves) {
        curr = applyMove(curr, m);
        cells.push_back(curr);
    }
    return cells;
}
