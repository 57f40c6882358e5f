#include "start_hand_handler.hpp"
#include "holdem/errors.hpp"
#include <algorithm>
#include <chrono>
#include <google/protobuf/util/time_util.h>

namespace table {
namespace handlers {

namespace {

poker::BlindPosted post_blind(int seat, const std::string& blind_type, int64_t amount,
                              int64_t stack, int64_t& pot_total) {
    int64_t actual_amount = std::min(amount, stack);
    pot_total += actual_amount;

    poker::BlindPosted event;
    event.set_seat(seat);
    event.set_blind_type(blind_type);
    event.set_amount(actual_amount);
    event.set_player_stack(stack - actual_amount);
    event.set_pot_total(pot_total);
    event.set_all_in(stack - actual_amount == 0);
    return event;
}

} // anonymous namespace

HandOpening handle_start_hand(const TableState& state, holdem::Deck& deck) {

    // Guard
    if (state.hand_in_progress) {
        throw holdem::ActionRejectedError::hand_in_progress("Hand already in progress");
    }

    // Validate
    if (state.seated_count() < 2) {
        throw holdem::ActionRejectedError::not_enough_players("Need at least 2 seated players");
    }

    // Compute
    const int n = static_cast<int>(state.seats.size());
    int dealer = state.dealer_index % n;
    if (state.seats[dealer].sitting_out) {
        dealer = state.next_seated_index(dealer);
    }

    // Heads-up, the dealer posts the small blind.
    const bool heads_up = state.seated_count() == 2;
    const int sb_seat = heads_up ? dealer : state.next_seated_index(dealer);
    const int bb_seat = state.next_seated_index(sb_seat);

    auto now = std::chrono::system_clock::now();
    auto timestamp = google::protobuf::util::TimeUtil::TimeTToTimestamp(
        std::chrono::system_clock::to_time_t(now));

    HandOpening opening;
    opening.started.set_hand_number(state.hand_number + 1);
    opening.started.set_dealer_index(dealer);
    opening.started.set_small_blind_seat(sb_seat);
    opening.started.set_big_blind_seat(bb_seat);
    opening.started.set_buy_in(state.buy_in);
    *opening.started.mutable_started_at() = timestamp;

    // Every stack is restored to the buy-in before the blinds go in.
    int64_t pot_total = 0;
    opening.blinds.push_back(post_blind(sb_seat, "small", state.small_blind, state.buy_in, pot_total));
    opening.blinds.push_back(post_blind(bb_seat, "big", state.big_blind, state.buy_in, pot_total));
    for (auto& blind : opening.blinds) {
        *blind.mutable_posted_at() = timestamp;
    }

    deck.reset();
    for (const auto& seat : state.seats) {
        if (seat.sitting_out) {
            continue;
        }
        auto* pc = opening.dealt.add_player_cards();
        pc->set_seat(seat.index);
        for (int i = 0; i < 2; ++i) {
            *pc->add_cards() = holdem::to_proto(deck.draw());
        }
    }

    auto can_act = [&](int seat) {
        if (state.seats[seat].sitting_out) {
            return false;
        }
        for (const auto& blind : opening.blinds) {
            if (blind.seat() == seat && blind.all_in()) {
                return false;
            }
        }
        return true;
    };

    // First to act: heads-up the small blind (dealer), otherwise the seat after the big blind.
    int action_on = -1;
    int start = heads_up ? sb_seat : (bb_seat + 1) % n;
    for (int i = 0; i < n; ++i) {
        int idx = (start + i) % n;
        if (can_act(idx)) {
            action_on = idx;
            break;
        }
    }
    opening.dealt.set_action_on(action_on);
    *opening.dealt.mutable_dealt_at() = timestamp;

    return opening;
}

} // namespace handlers
} // namespace table
