#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

using Position = std::pair<int, int>;  // (row, col)

enum class Cell : std::uint8_t {
    Empty,
    DryTrash,
    WetTrash,
    Dusty,
    Soaked,
    Bin,
    Wall
};

constexpr std::size_t kCellTypeCount = 7;

enum class AgentKind {
    GarbageCollector,
    Vacuum,
    Mop
};

// 한 틱 안에서 에이전트를 움직이는 고정 순서
constexpr AgentKind kAgentOrder[] = {
    AgentKind::GarbageCollector, AgentKind::Vacuum, AgentKind::Mop
};

enum class Move {
    Up,
    Down,
    Left,
    Right
};

// A* 이웃 확장 순서. 동점 처리 결과가 항상 같도록 고정한다.
constexpr Move kMoveOrder[] = {Move::Up, Move::Down, Move::Left, Move::Right};

// 충돌 회피 후보: 제자리 + 4방향
inline const std::vector<Position> kStepOffsets = {{0, 0}, {-1, 0}, {1, 0}, {0, -1}, {0, 1}};

// Unloaded는 에이전트 쪽 결과 (GridModel은 반환하지 않음)
enum class CleanupResult {
    None,
    Bagged,
    Cleaned,
    Unloaded
};

using AgentLocations = std::map<AgentKind, Position>;

inline Position offsetOf(Move move) {
    switch (move) {
        case Move::Up:    return {-1, 0};
        case Move::Down:  return {1, 0};
        case Move::Left:  return {0, -1};
        case Move::Right: return {0, 1};
    }
    return {0, 0};
}

inline Position applyMove(const Position& pos, Move move) {
    const Position d = offsetOf(move);
    return {pos.first + d.first, pos.second + d.second};
}

inline int manhattanDistance(const Position& a, const Position& b) {
    const int dr = a.first - b.first;
    const int dc = a.second - b.second;
    return (dr < 0 ? -dr : dr) + (dc < 0 ? -dc : dc);
}

inline bool isHazard(Cell cell) {
    return cell == Cell::DryTrash || cell == Cell::WetTrash ||
           cell == Cell::Dusty || cell == Cell::Soaked;
}

inline bool isTrash(Cell cell) {
    return cell == Cell::DryTrash || cell == Cell::WetTrash;
}

std::string toString(Cell cell);
std::string toString(AgentKind kind);
std::string toString(Move move);
std::string toString(const Position& pos);

// '.' 빈칸, 'd' 마른 쓰레기, 'w' 젖은 쓰레기, ':' 먼지, '~' 물기, 'B' 쓰레기통, '#' 벽
char toChar(Cell cell);
Cell cellFromChar(char c);
