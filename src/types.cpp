#include "cleaning_planner/types.hpp"

#include <stdexcept>

std::string toString(Cell cell) {
    switch (cell) {
        case Cell::Empty:    return "Empty";
        case Cell::DryTrash: return "DryTrash";
        case Cell::WetTrash: return "WetTrash";
        case Cell::Dusty:    return "Dusty";
        case Cell::Soaked:   return "Soaked";
        case Cell::Bin:      return "Bin";
        case Cell::Wall:     return "Wall";
    }
    return "Unknown";
}

std::string toString(AgentKind kind) {
    switch (kind) {
        case AgentKind::GarbageCollector: return "GarbageCollector";
        case AgentKind::Vacuum:           return "Vacuum";
        case AgentKind::Mop:              return "Mop";
    }
    return "Unknown";
}

std::string toString(Move move) {
    switch (move) {
        case Move::Up:    return "Up";
        case Move::Down:  return "Down";
        case Move::Left:  return "Left";
        case Move::Right: return "Right";
    }
    return "Unknown";
}

std::string toString(const Position& pos) {
    return "(" + std::to_string(pos.first) + ", " + std::to_string(pos.second) + ")";
}

char toChar(Cell cell) {
    switch (cell) {
        case Cell::Empty:    return '.';
        case Cell::DryTrash: return 'd';
        case Cell::WetTrash: return 'w';
        case Cell::Dusty:    return ':';
        case Cell::Soaked:   return '~';
        case Cell::Bin:      return 'B';
        case Cell::Wall:     return '#';
    }
    return '?';
}

Cell cellFromChar(char c) {
    switch (c) {
        case '.': return Cell::Empty;
        case 'd': return Cell::DryTrash;
        case 'w': return Cell::WetTrash;
        case ':': return Cell::Dusty;
        case '~': return Cell::Soaked;
        case 'B': return Cell::Bin;
        case '#': return Cell::Wall;
        default:
            throw std::invalid_argument(std::string("알 수 없는 셀 문자: '") + c + "'");
    }
}
