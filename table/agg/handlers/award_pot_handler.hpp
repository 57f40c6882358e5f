#pragma once

#include <utility>
#include "table_state.hpp"
#include "poker/table.pb.h"

namespace table {
namespace handlers {

/// Evaluate every contender, split the pot among the best hands.
/// The indivisible remainder goes to the first winner in ranked order.
std::pair<poker::PotAwarded, poker::HandComplete> handle_showdown(const TableState& state);

/// Award the whole pot to the only player left in the hand.
std::pair<poker::PotAwarded, poker::HandComplete> handle_uncontested(const TableState& state);

} // namespace handlers
} // namespace table
