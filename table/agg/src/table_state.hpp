#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "holdem/card.hpp"
#include "holdem/hand_evaluator.hpp"
#include "poker/poker_types.pb.h"
#include "poker/table.pb.h"

namespace table {

struct Seat {
    int index = 0;
    std::string name;
    bool is_human = false;
    int64_t chips = 0;
    std::vector<holdem::Card> hand;
    int64_t bet = 0;            // committed this betting round
    bool folded = false;
    bool all_in = false;
    bool sitting_out = false;
    bool has_acted = false;     // scoped to the current betting round
    std::optional<holdem::HandValue> hand_result;

    bool in_hand() const { return !folded && !sitting_out; }
    bool can_act() const { return in_hand() && !all_in; }
};

/// Table aggregate state. Only apply_event mutates it.
///
/// `pot` already contains the chips behind every seat's current `bet`,
/// so `pot + sum(chips)` is constant for the whole hand.
struct TableState {
    std::vector<Seat> seats;
    std::vector<holdem::Card> community_cards;
    int64_t pot = 0;
    poker::BettingPhase phase = poker::WAITING;
    int dealer_index = 0;
    int current_player_index = -1;
    int small_blind_seat = -1;
    int big_blind_seat = -1;
    int64_t small_blind = 1;
    int64_t big_blind = 2;
    int64_t buy_in = 200;
    int64_t min_raise = 2;
    int64_t last_raise = 0;
    int64_t hand_number = 0;
    bool hand_in_progress = false;
    uint64_t version = 0;       // bumped by every applied event

    bool is_betting_phase() const;
    const Seat* current_seat() const;

    int64_t current_max_bet() const;
    int64_t call_amount() const;
    int64_t min_raise_total() const;
    bool can_check() const;
    std::vector<poker::ActionType> valid_actions() const;

    std::vector<const Seat*> players_in_hand() const;
    std::vector<const Seat*> players_still_acting() const;
    int seated_count() const;

    /// Next seat after `from` that is not sitting out.
    int next_seated_index(int from) const;
    /// Next seat after `from` that can still act, or -1 if there is none.
    int next_active_index(int from) const;

    /// Every seat that can still act has acted and matched the maximum bet.
    bool is_betting_round_complete() const;

    int64_t chips_in_play() const;

    static void apply_event(TableState& state, const google::protobuf::Any& event_any);
};

} // namespace table
