#pragma once

#include "table_state.hpp"
#include "poker/table.pb.h"

namespace table {
namespace handlers {

/// Handle PlayerAction command.
poker::ActionTaken handle_action(
    const poker::PlayerAction& cmd,
    const TableState& state);

} // namespace handlers
} // namespace table
