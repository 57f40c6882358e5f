#include "table_state.hpp"
#include <algorithm>

namespace table {

bool TableState::is_betting_phase() const {
    return hand_in_progress &&
           (phase == poker::PREFLOP || phase == poker::FLOP ||
            phase == poker::TURN || phase == poker::RIVER);
}

const Seat* TableState::current_seat() const {
    if (current_player_index < 0 || current_player_index >= static_cast<int>(seats.size())) {
        return nullptr;
    }
    return &seats[current_player_index];
}

int64_t TableState::current_max_bet() const {
    int64_t max_bet = 0;
    for (const auto& seat : seats) {
        max_bet = std::max(max_bet, seat.bet);
    }
    return max_bet;
}

int64_t TableState::call_amount() const {
    const Seat* seat = current_seat();
    if (!seat) {
        return 0;
    }
    return std::min(current_max_bet() - seat->bet, seat->chips);
}

int64_t TableState::min_raise_total() const {
    const Seat* seat = current_seat();
    if (!seat) {
        return 0;
    }
    int64_t min_total = current_max_bet() + std::max(min_raise, big_blind);
    return std::min(min_total, seat->chips + seat->bet);
}

bool TableState::can_check() const {
    const Seat* seat = current_seat();
    return seat && seat->bet >= current_max_bet();
}

std::vector<poker::ActionType> TableState::valid_actions() const {
    const Seat* seat = current_seat();
    if (!is_betting_phase() || !seat || !seat->can_act()) {
        return {};
    }
    std::vector<poker::ActionType> actions = {poker::FOLD};
    int64_t to_call = current_max_bet() - seat->bet;
    if (to_call == 0) {
        actions.push_back(poker::CHECK);
    } else {
        actions.push_back(poker::CALL);
    }
    if (seat->chips > to_call) {
        actions.push_back(poker::RAISE);
    }
    return actions;
}

std::vector<const Seat*> TableState::players_in_hand() const {
    std::vector<const Seat*> result;
    for (const auto& seat : seats) {
        if (seat.in_hand()) {
            result.push_back(&seat);
        }
    }
    return result;
}

std::vector<const Seat*> TableState::players_still_acting() const {
    std::vector<const Seat*> result;
    for (const auto& seat : seats) {
        if (seat.can_act()) {
            result.push_back(&seat);
        }
    }
    return result;
}

int TableState::seated_count() const {
    return static_cast<int>(std::count_if(seats.begin(), seats.end(),
                                          [](const Seat& s) { return !s.sitting_out; }));
}

int TableState::next_seated_index(int from) const {
    const int n = static_cast<int>(seats.size());
    for (int i = 1; i <= n; ++i) {
        int idx = (from + i) % n;
        if (!seats[idx].sitting_out) {
            return idx;
        }
    }
    return -1;
}

int TableState::next_active_index(int from) const {
    const int n = static_cast<int>(seats.size());
    for (int i = 1; i <= n; ++i) {
        int idx = (from + i) % n;
        if (seats[idx].can_act()) {
            return idx;
        }
    }
    return -1;
}

bool TableState::is_betting_round_complete() const {
    int64_t max_bet = current_max_bet();
    for (const auto& seat : seats) {
        if (!seat.can_act()) {
            continue;
        }
        if (!seat.has_acted || seat.bet < max_bet) {
            return false;
        }
    }
    return true;
}

int64_t TableState::chips_in_play() const {
    int64_t total = pot;
    for (const auto& seat : seats) {
        total += seat.chips;
    }
    return total;
}

void TableState::apply_event(TableState& state, const google::protobuf::Any& event_any) {
    ++state.version;

    if (event_any.Is<poker::PlayersSeated>()) {
        poker::PlayersSeated event;
        if (event_any.UnpackTo(&event)) {
            state.seats.clear();
            for (const auto& assigned : event.seats()) {
                Seat seat;
                seat.index = assigned.seat();
                seat.name = assigned.name();
                seat.is_human = assigned.is_human();
                seat.chips = event.buy_in();
                state.seats.push_back(seat);
            }
            state.buy_in = event.buy_in();
            state.small_blind = event.small_blind();
            state.big_blind = event.big_blind();
            state.min_raise = event.big_blind();
            state.last_raise = 0;
            state.hand_in_progress = false;
            state.community_cards.clear();
            state.pot = 0;
            state.phase = poker::WAITING;
            state.current_player_index = -1;
        }
    }
    else if (event_any.Is<poker::SittingOutChanged>()) {
        poker::SittingOutChanged event;
        if (event_any.UnpackTo(&event)) {
            state.seats[event.seat()].sitting_out = event.sitting_out();
        }
    }
    else if (event_any.Is<poker::HandStarted>()) {
        poker::HandStarted event;
        if (event_any.UnpackTo(&event)) {
            state.hand_number = event.hand_number();
            state.dealer_index = event.dealer_index();
            state.small_blind_seat = event.small_blind_seat();
            state.big_blind_seat = event.big_blind_seat();
            state.buy_in = event.buy_in();
            state.hand_in_progress = true;
            state.community_cards.clear();
            state.pot = 0;
            state.min_raise = state.big_blind;
            state.last_raise = 0;
            state.current_player_index = -1;

            for (auto& seat : state.seats) {
                seat.hand.clear();
                seat.bet = 0;
                seat.folded = false;
                seat.all_in = false;
                seat.has_acted = false;
                seat.hand_result.reset();
                seat.chips = event.buy_in();
            }
        }
    }
    else if (event_any.Is<poker::BlindPosted>()) {
        poker::BlindPosted event;
        if (event_any.UnpackTo(&event)) {
            Seat& seat = state.seats[event.seat()];
            seat.chips = event.player_stack();
            seat.bet = event.amount();
            seat.all_in = event.all_in();
            state.pot = event.pot_total();
        }
    }
    else if (event_any.Is<poker::CardsDealt>()) {
        poker::CardsDealt event;
        if (event_any.UnpackTo(&event)) {
            for (const auto& pc : event.player_cards()) {
                Seat& seat = state.seats[pc.seat()];
                for (const auto& card : pc.cards()) {
                    seat.hand.push_back(holdem::from_proto(card));
                }
            }
            // The big blind keeps its option: nobody has acted yet.
            for (auto& seat : state.seats) {
                seat.has_acted = false;
            }
            state.phase = poker::PREFLOP;
            state.current_player_index = event.action_on();
        }
    }
    else if (event_any.Is<poker::ActionTaken>()) {
        poker::ActionTaken event;
        if (event_any.UnpackTo(&event)) {
            Seat& seat = state.seats[event.seat()];
            if (event.action() == poker::FOLD) {
                seat.folded = true;
            } else {
                seat.chips = event.player_stack();
                seat.bet = event.bet_total();
                seat.all_in = event.all_in();
                state.pot = event.pot_total();
            }
            if (event.reopened()) {
                state.min_raise = event.min_raise();
                state.last_raise = event.bet_total();
                for (auto& other : state.seats) {
                    if (other.index != seat.index && other.can_act()) {
                        other.has_acted = false;
                    }
                }
            }
            seat.has_acted = true;
        }
    }
    else if (event_any.Is<poker::TurnAdvanced>()) {
        poker::TurnAdvanced event;
        if (event_any.UnpackTo(&event)) {
            state.current_player_index = event.seat();
        }
    }
    else if (event_any.Is<poker::CommunityCardsDealt>()) {
        poker::CommunityCardsDealt event;
        if (event_any.UnpackTo(&event)) {
            for (const auto& card : event.cards()) {
                state.community_cards.push_back(holdem::from_proto(card));
            }
            for (auto& seat : state.seats) {
                seat.bet = 0;
                seat.has_acted = false;
            }
            state.min_raise = state.big_blind;
            state.last_raise = 0;
            state.phase = event.phase();
            state.current_player_index = event.action_on();
        }
    }
    else if (event_any.Is<poker::ShowdownStarted>()) {
        for (auto& seat : state.seats) {
            seat.bet = 0;
        }
        state.min_raise = state.big_blind;
        state.last_raise = 0;
        state.phase = poker::SHOWDOWN;
        state.current_player_index = -1;
    }
    else if (event_any.Is<poker::PotAwarded>()) {
        poker::PotAwarded event;
        if (event_any.UnpackTo(&event)) {
            for (const auto& hand : event.hands()) {
                state.seats[hand.seat()].hand_result = holdem::from_proto(hand.result());
            }
            for (const auto& winner : event.winners()) {
                state.seats[winner.seat()].chips += winner.amount();
                state.pot -= winner.amount();
            }
            for (auto& seat : state.seats) {
                seat.bet = 0;
            }
            state.phase = poker::SHOWDOWN;
            state.current_player_index = -1;
        }
    }
    else if (event_any.Is<poker::HandComplete>()) {
        state.hand_in_progress = false;
        state.current_player_index = -1;
        if (!state.seats.empty()) {
            state.dealer_index = (state.dealer_index + 1) % static_cast<int>(state.seats.size());
        }
    }
}

} // namespace table
