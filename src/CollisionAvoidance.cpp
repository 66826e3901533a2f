#include "cleaning_planner/CollisionAvoidance.hpp"

#include <algorithm>
#include <limits>

namespace {

constexpr int kUnreachable = std::numeric_limits<int>::max();

bool occupied(const Position& pos, const std::vector<AgentView>& others) {
    for (const auto& o : others) {
        if (o.position == pos) return true;
    }
    return false;
}

}  // namespace

CollisionAvoidance::CollisionAvoidance(CollisionAvoidanceConfig config, std::mt19937& rng)
    : config_(config), rng_(rng) {}

int CollisionAvoidance::separation(const Position& at, const std::vector<AgentView>& others) const {
    int best = std::numeric_limits<int>::max();
    for (const auto& o : others) {
        best = std::min(best, manhattanDistance(at, o.position) + o.priority);
    }
    return best;
}

std::vector<ScoredStep> CollisionAvoidance::scoreSteps(const GridModel& grid,
                                                       const AgentView& self,
                                                       const std::vector<AgentView>& others) const {
    std::vector<ScoredStep> steps;
    for (const auto& d : kStepOffsets) {
        const Position target{self.position.first + d.first, self.position.second + d.second};
        const bool stay = (target == self.position);
        if (!stay && (!grid.isWalkable(target) || occupied(target, others))) continue;
        steps.push_back(ScoredStep{target, separation(target, others)});
    }
    return steps;
}

bool CollisionAvoidance::isCrowded(const AgentView& self, const std::vector<AgentView>& others) const {
    if (others.empty()) return false;
    const int current = separation(self.position, others);
    // 가득 찬 수거 에이전트는 거리 2 이상이면 비키지 않는다
    if (self.urgent && current >= 2) return false;
    return current <= config_.crowded_separation;
}

const ScoredStep& CollisionAvoidance::pickRandom(const std::vector<const ScoredStep*>& ties) {
    if (ties.size() == 1) return *ties.front();
    std::uniform_int_distribution<std::size_t> dist(0, ties.size() - 1);
    return *ties[dist(rng_)];
}

std::optional<Position> CollisionAvoidance::evade(const GridModel& grid,
                                                  const AgentView& self,
                                                  const std::vector<AgentView>& others) {
    if (others.empty()) return std::nullopt;

    const int current = separation(self.position, others);
    if (current > config_.comfortable_separation) return std::nullopt;
    if (self.urgent && current >= 2) return std::nullopt;

    const auto steps = scoreSteps(grid, self, others);
    int best = std::numeric_limits<int>::min();
    for (const auto& s : steps) best = std::max(best, s.score);

    std::vector<const ScoredStep*> ties;
    for (const auto& s : steps) {
        if (s.score == best) ties.push_back(&s);
    }
    return pickRandom(ties).target;
}

Position CollisionAvoidance::chooseStep(const GridModel& grid,
                                        const AgentView& self,
                                        const std::vector<AgentView>& others,
                                        const GoalDistanceFn& distance_to_goal) {
    const auto steps = scoreSteps(grid, self, others);

    std::vector<int> goal_dist;
    goal_dist.reserve(steps.size());
    for (const auto& s : steps) {
        goal_dist.push_back(distance_to_goal(s.target).value_or(kUnreachable));
    }

    std::vector<const ScoredStep*> ties;
    if (!isCrowded(self, others)) {
        // 목표에 가장 가까워지는 후보 중 개인 공간이 가장 넓은 것
        const int best_dist = *std::min_element(goal_dist.begin(), goal_dist.end());
        if (best_dist == kUnreachable) return self.position;
        int best_score = std::numeric_limits<int>::min();
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (goal_dist[i] == best_dist) best_score = std::max(best_score, steps[i].score);
        }
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (goal_dist[i] == best_dist && steps[i].score == best_score) ties.push_back(&steps[i]);
        }
    } else {
        // 개인 공간이 가장 넓은 후보 중 목표에 가장 가까운 것
        int best_score = std::numeric_limits<int>::min();
        for (const auto& s : steps) best_score = std::max(best_score, s.score);
        int best_dist = kUnreachable;
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (steps[i].score == best_score) best_dist = std::min(best_dist, goal_dist[i]);
        }
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (steps[i].score == best_score && goal_dist[i] == best_dist) ties.push_back(&steps[i]);
        }
    }
    return pickRandom(ties).target;
}
