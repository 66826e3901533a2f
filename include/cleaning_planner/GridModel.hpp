#pragma once

#include "cleaning_planner/types.hpp"

#include <array>
#include <string>
#include <vector>

class GridModel {
public:
    explicit GridModel(std::vector<std::vector<Cell>> cells);
    GridModel(int rows, int cols, Cell fill = Cell::Empty);

    // 테스트/디버그용: 문자 지도에서 생성 (toChar 참고)
    static GridModel fromRows(const std::vector<std::string>& rows);

    int rows() const { return static_cast<int>(cells_.size()); }
    int cols() const { return static_cast<int>(cells_[0].size()); }
    int area() const { return rows() * cols(); }

    bool inBounds(const Position& pos) const;
    bool isWalkable(const Position& pos) const;

    Cell cellAt(const Position& pos) const;

    // 외부 편집. 코어는 임의 변경으로 취급하고 다음 틱에 목표를 재검증한다.
    void setCell(const Position& pos, Cell cell);

    // 방문한 에이전트 종류에 맞는 셀만 바꾼다. 벽과 쓰레기통은 그대로.
    CleanupResult cleanUp(const Position& pos, AgentKind acting_kind);

    // 변경 때마다 갱신되는 카운트
    int count(Cell cell) const { return counts_[static_cast<std::size_t>(cell)]; }
    int hazardCount() const;

    // 카운트와 독립적인 전체 스캔 (교차 확인용)
    int scanCount(Cell cell) const;

    // 행 우선 순서
    std::vector<Position> cellsOf(const std::vector<Cell>& types) const;

    std::string render() const;

    // 벽이 생기거나 없어질 때마다 증가. 도달 가능성 캐시 무효화용.
    unsigned long wallRevision() const { return wall_revision_; }

private:
    std::vector<std::vector<Cell>> cells_;
    std::array<int, kCellTypeCount> counts_{};
    unsigned long wall_revision_{0};

    void checkBounds(const Position& pos) const;
};
