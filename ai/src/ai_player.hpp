#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include "holdem/card.hpp"
#include "poker/table.pb.h"

namespace ai {

/// Closed-form preflop estimate in [0, 1] from the two hole cards.
double preflop_strength(const holdem::Card& first, const holdem::Card& second);

/// Estimate in [0, 1] from the made hand plus draw bonuses. Needs at least 3 community cards.
double postflop_strength(const std::vector<holdem::Card>& hole,
                         const std::vector<holdem::Card>& community);

/// Heuristic opponent. Decisions depend only on the snapshot and the random source.
class AiPlayer {
public:
    /// Returns uniformly distributed values in [0, 1).
    using UniformSource = std::function<double()>;

    static constexpr double kPerturbation = 0.15;
    static constexpr double kPositionBonus = 0.05;

    AiPlayer();
    explicit AiPlayer(uint64_t seed);
    explicit AiPlayer(UniformSource uniform);

    /// Action for `seat`, or std::nullopt when the seat has no legal action.
    std::optional<poker::PlayerAction> decide(const poker::TableSnapshot& snapshot, int seat);

    /// Strength after perturbation and position bonus, clamped to [0, 1].
    double estimate_strength(const poker::TableSnapshot& snapshot, int seat);

private:
    poker::PlayerAction make_raise(const poker::TableSnapshot& snapshot, int seat, double strength);

    UniformSource uniform_;
};

} // namespace ai
