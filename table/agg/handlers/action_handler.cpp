#include "action_handler.hpp"
#include "holdem/errors.hpp"
#include <algorithm>
#include <chrono>
#include <google/protobuf/util/time_util.h>

namespace table {
namespace handlers {

poker::ActionTaken handle_action(
    const poker::PlayerAction& cmd,
    const TableState& state) {

    // Guard
    if (!state.is_betting_phase()) {
        throw holdem::ActionRejectedError::no_hand_in_progress("No betting round in progress");
    }
    if (!state.current_seat() || cmd.seat() != state.current_player_index) {
        throw holdem::ActionRejectedError::invalid_actor(
            "Seat " + std::to_string(cmd.seat()) + " is not to act");
    }

    // Validate
    const Seat& player = state.seats[cmd.seat()];
    if (player.folded) {
        throw holdem::ActionRejectedError::player_cannot_act("Player has folded");
    }
    if (player.all_in) {
        throw holdem::ActionRejectedError::player_cannot_act("Player is all-in");
    }

    const auto legal = state.valid_actions();
    if (std::find(legal.begin(), legal.end(), cmd.action()) == legal.end()) {
        throw holdem::ActionRejectedError::illegal_action(
            poker::ActionType_Name(cmd.action()) + " is not legal now");
    }

    // Compute
    const int64_t max_bet = state.current_max_bet();
    int64_t amount = 0;
    int64_t new_bet = player.bet;
    bool reopened = false;
    int64_t min_raise = state.min_raise;

    if (cmd.action() == poker::CALL) {
        amount = std::min(max_bet - player.bet, player.chips);
        new_bet = player.bet + amount;
    } else if (cmd.action() == poker::RAISE) {
        // Out-of-range totals are clamped, never rejected.
        new_bet = std::clamp(cmd.amount(), max_bet, player.chips + player.bet);
        amount = new_bet - player.bet;
        if (new_bet > max_bet) {
            reopened = true;
            min_raise = new_bet - max_bet;
        }
    }

    int64_t new_stack = player.chips - amount;

    auto now = std::chrono::system_clock::now();
    auto timestamp = google::protobuf::util::TimeUtil::TimeTToTimestamp(
        std::chrono::system_clock::to_time_t(now));

    poker::ActionTaken event;
    event.set_seat(cmd.seat());
    event.set_action(cmd.action());
    event.set_amount(amount);
    event.set_bet_total(new_bet);
    event.set_player_stack(new_stack);
    event.set_pot_total(state.pot + amount);
    event.set_all_in(cmd.action() != poker::FOLD && new_stack == 0);
    event.set_reopened(reopened);
    event.set_min_raise(min_raise);
    *event.mutable_action_at() = timestamp;

    return event;
}

} // namespace handlers
} // namespace table
