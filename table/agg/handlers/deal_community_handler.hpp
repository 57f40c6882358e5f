#pragma once

#include "table_state.hpp"
#include "holdem/deck.hpp"
#include "poker/table.pb.h"

namespace table {
namespace handlers {

/// Close the current betting round and deal the next street from `deck`.
poker::CommunityCardsDealt handle_deal_community(
    const TableState& state,
    holdem::Deck& deck);

} // namespace handlers
} // namespace table
