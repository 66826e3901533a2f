#pragma once

#include "cleaning_planner/GoalSelector.hpp"
#include "cleaning_planner/GridModel.hpp"
#include "cleaning_planner/types.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// 에이전트는 좌표만 가진다. 그리드는 매 결정마다 참조로 넘겨받는다.
class CleaningAgent {
public:
    CleaningAgent(AgentKind kind, const Position& pos);
    virtual ~CleaningAgent() = default;

    virtual std::unique_ptr<CleaningAgent> clone() const = 0;

    AgentKind kind() const { return kind_; }

    const Position& position() const { return pos_; }
    void setPosition(const Position& pos) { pos_ = pos; }

    const std::optional<Position>& goal() const { return goal_; }
    void setGoal(const std::optional<Position>& goal) { goal_ = goal; }
    void clearGoal() {
        goal_.reset();
        trip_.clear();
    }

    // 스텝 시작 시 상태 전이 (기본은 없음)
    virtual void beginStep(const GridModel&) {}

    // 확정된 이동 목록을 끝까지 따라가는 상태인가
    virtual bool holdsCommittedTrip() const { return false; }
    const std::deque<Move>& committedTrip() const { return trip_; }
    void commitTrip(const std::vector<Move>& moves) { trip_.assign(moves.begin(), moves.end()); }
    void popTripStep() { trip_.pop_front(); }
    void dropTrip() { trip_.clear(); }

    // 지금 치우러 가는 셀 종류
    virtual std::vector<Cell> targetCells() const = 0;

    // excluded 에 든 셀은 후보에서 뺀다
    virtual std::optional<Position> selectGoal(const GridModel& grid,
                                               const GoalSelector& selector,
                                               const CellSet& excluded) const;

    // 경로 계획에 실패한 목표. 벽 배치가 바뀌면 컨트롤러가 비운다.
    const CellSet& unreachable() const { return unreachable_; }
    void markUnreachable(const Position& cell) { unreachable_.insert(cell); }
    void forgetUnreachable() { unreachable_.clear(); }

    // 목표 셀이 여전히 targetCells 중 하나인가
    bool goalStillValid(const GridModel& grid) const;

    // 현재 칸이 targetCells 에 해당할 때만 치운다
    virtual CleanupResult cleanUp(GridModel& grid);

    virtual int priority() const { return 0; }
    virtual bool isUrgent() const { return false; }
    virtual bool hasPendingWork() const { return goal_.has_value(); }

    virtual std::string describe() const;

protected:
    AgentKind kind_;
    Position pos_;
    std::optional<Position> goal_;
    std::deque<Move> trip_;
    CellSet unreachable_;
};

class GarbageCollectorAgent : public CleaningAgent {
public:
    enum class Mode {
        Collecting,
        ReturningToBin
    };

    GarbageCollectorAgent(const Position& pos, int capacity);

    std::unique_ptr<CleaningAgent> clone() const override;

    int load() const { return load_; }
    int capacity() const { return capacity_; }
    Mode mode() const { return mode_; }
    bool isFull() const { return load_ >= capacity_; }

    // 가득 찼거나 갈 수 있는 쓰레기가 바닥났으면 쓰레기통으로 전환. 바뀌면 true.
    bool updateMode(const GridModel& grid);

    void beginStep(const GridModel& grid) override { updateMode(grid); }
    bool holdsCommittedTrip() const override { return mode_ == Mode::ReturningToBin; }

    std::vector<Cell> targetCells() const override;
    std::optional<Position> selectGoal(const GridModel& grid,
                                       const GoalSelector& selector,
                                       const CellSet& excluded) const override;
    CleanupResult cleanUp(GridModel& grid) override;

    int priority() const override { return isFull() ? 2 : 1; }
    bool isUrgent() const override { return isFull(); }
    bool hasPendingWork() const override { return goal_.has_value() || load_ > 0; }

    std::string describe() const override;

private:
    int load_{0};
    int capacity_;
    Mode mode_{Mode::Collecting};

    void startReturn();
};

class VacuumAgent : public CleaningAgent {
public:
    explicit VacuumAgent(const Position& pos);

    std::unique_ptr<CleaningAgent> clone() const override;
    std::vector<Cell> targetCells() const override { return {Cell::Dusty}; }
};

class MopAgent : public CleaningAgent {
public:
    explicit MopAgent(const Position& pos);

    std::unique_ptr<CleaningAgent> clone() const override;
    std::vector<Cell> targetCells() const override { return {Cell::Soaked}; }
};

std::unique_ptr<CleaningAgent> makeAgent(AgentKind kind, const Position& pos, int garbage_capacity);

std::string toString(GarbageCollectorAgent::Mode mode);
