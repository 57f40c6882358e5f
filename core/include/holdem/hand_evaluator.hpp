#pragma once

#include <vector>
#include "holdem/card.hpp"
#include "poker/poker_types.pb.h"

namespace holdem {

/// Category plus tie-break ranks (most significant first) and the five cards that make it.
struct HandValue {
    poker::HandCategory category = poker::HIGH_CARD;
    std::vector<int> tie_break;
    std::vector<Card> best;
};

/// Scores exactly five cards. Throws std::invalid_argument for any other count.
HandValue evaluate_five(const std::vector<Card>& cards);

/// Best five-card hand out of five or more cards (every C(n,5) subset is scored).
/// Throws std::invalid_argument for fewer than five cards.
HandValue evaluate_hand(const std::vector<Card>& cards);

/// Negative, zero or positive as a is weaker than, equal to or stronger than b.
int compare_hands(const HandValue& a, const HandValue& b);

const char* hand_name(poker::HandCategory category);

poker::HandResult to_proto(const HandValue& value);
HandValue from_proto(const poker::HandResult& result);

}  // namespace holdem
