#include "holdem/deck.hpp"
#include "holdem/errors.hpp"
#include <algorithm>

namespace holdem {

Deck::Deck() : rng_(std::random_device{}()) {
    reset();
}

Deck::Deck(uint64_t seed) : rng_(seed) {
    reset();
}

void Deck::reset() {
    cards_.clear();
    cards_.reserve(kSize);
    for (auto suit : all_suits()) {
        for (int rank = kLowestRank; rank <= kHighestRank; ++rank) {
            cards_.push_back(Card{suit, rank});
        }
    }
    std::shuffle(cards_.begin(), cards_.end(), rng_);
}

Card Deck::draw() {
    if (cards_.empty()) {
        throw EmptyDeckError("Deck is empty");
    }
    Card card = cards_.back();
    cards_.pop_back();
    return card;
}

}  // namespace holdem
