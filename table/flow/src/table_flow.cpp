#include "table_flow.hpp"
#include <utility>
#include "holdem/logging.hpp"

namespace table_flow {

TableFlow::TableFlow(table::Table& table, holdem::TaskQueue& queue, Decider decider)
    : table_(table)
    , queue_(queue)
    , decider_(std::move(decider)) {
    table_.subscribe_state_change([this]() { continue_play(); });
}

void TableFlow::continue_play() {
    const auto& state = table_.state();
    if (!state.is_betting_phase()) {
        return;
    }
    const auto* seat = state.current_seat();
    if (!seat || seat->is_human || !seat->can_act()) {
        return;
    }

    const uint64_t version = state.version;
    if (scheduled_version_ == version) {
        return;
    }
    scheduled_version_ = version;

    const int index = seat->index;
    queue_.schedule(
        table_.pacing(),
        [this, version]() { return table_.state().version == version; },
        [this, index]() { play_turn(index); });
}

void TableFlow::play_turn(int seat) {
    auto snapshot = table_.get_state();
    auto decision = decider_(snapshot, seat);

    if (decision) {
        auto outcome = table_.perform_action(*decision);
        if (outcome == holdem::ActionOutcome::Applied) {
            decisions_++;
            return;
        }
        holdem::log_warn(DOMAIN, "decision_rejected", {
            {"seat", seat},
            {"action", poker::ActionType_Name(decision->action())},
            {"amount", decision->amount()},
            {"reason", holdem::to_string(outcome)}
        });
    }

    // Checking is always legal when there is nothing to call, folding otherwise.
    poker::PlayerAction fallback;
    fallback.set_seat(seat);
    fallback.set_action(snapshot.can_check() ? poker::CHECK : poker::FOLD);
    auto outcome = table_.perform_action(fallback);
    if (outcome != holdem::ActionOutcome::Applied) {
        holdem::log_error(DOMAIN, "fallback_rejected", {
            {"seat", seat},
            {"reason", holdem::to_string(outcome)}
        });
        return;
    }
    decisions_++;
    fallbacks_++;
}

} // namespace table_flow
