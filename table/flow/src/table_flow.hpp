#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include "table.hpp"
#include "holdem/task_queue.hpp"
#include "poker/table.pb.h"

namespace table_flow {

/// Picks an action for `seat` from a table snapshot. std::nullopt means no opinion.
using Decider = std::function<std::optional<poker::PlayerAction>(
    const poker::TableSnapshot& snapshot, int seat)>;

/// Drives the automated seats of a table.
///
/// Whenever the table changes and an automated seat is to act, one decision
/// is scheduled on the queue after the table's pacing delay. The decision is
/// dropped if the table has moved on by the time it is due.
class TableFlow {
public:
    static constexpr const char* DOMAIN = "table_flow";

    TableFlow(table::Table& table, holdem::TaskQueue& queue, Decider decider);

    /// Schedules the next automated decision if one is due and not already pending.
    void continue_play();

    /// Decisions applied so far, fallbacks included.
    uint64_t decisions() const { return decisions_; }

    /// Decisions the table rejected and replaced with check or fold.
    uint64_t fallbacks() const { return fallbacks_; }

private:
    void play_turn(int seat);

    table::Table& table_;
    holdem::TaskQueue& queue_;
    Decider decider_;
    uint64_t scheduled_version_ = std::numeric_limits<uint64_t>::max();
    uint64_t decisions_ = 0;
    uint64_t fallbacks_ = 0;
};

} // namespace table_flow
