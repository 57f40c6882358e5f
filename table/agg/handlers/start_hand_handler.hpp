#pragma once

#include <vector>
#include "table_state.hpp"
#include "holdem/deck.hpp"
#include "poker/table.pb.h"

namespace table {
namespace handlers {

/// Events that open a hand, in the order they are applied.
struct HandOpening {
    poker::HandStarted started;
    std::vector<poker::BlindPosted> blinds;
    poker::CardsDealt dealt;
};

/// Handle a start-hand request. Reshuffles `deck` and deals from it.
HandOpening handle_start_hand(const TableState& state, holdem::Deck& deck);

} // namespace handlers
} // namespace table
