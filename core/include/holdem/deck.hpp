#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>
#include "holdem/card.hpp"

namespace holdem {

/// The 52-card deck for one hand. Cards are drawn from the back.
class Deck {
public:
    static constexpr std::size_t kSize = 52;

    /// Seeds from std::random_device.
    Deck();
    explicit Deck(uint64_t seed);

    /// Repopulates all 52 cards and shuffles them (Fisher-Yates via std::shuffle).
    void reset();

    /// Removes and returns the top card. Throws EmptyDeckError when exhausted.
    Card draw();

    std::size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }

private:
    std::vector<Card> cards_;
    std::mt19937_64 rng_;
};

}  // namespace holdem
