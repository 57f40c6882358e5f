#include "table.hpp"
#include <string>
#include <google/protobuf/util/time_util.h>
#include "start_hand_handler.hpp"
#include "action_handler.hpp"
#include "deal_community_handler.hpp"
#include "award_pot_handler.hpp"
#include "holdem/logging.hpp"

namespace table {

namespace {

const std::vector<std::string>& bot_names() {
    static const std::vector<std::string> names = {
        "Alice", "Bob", "Charlie", "Diana", "Eve", "Frank", "Grace", "Hank", "Ivy"
    };
    return names;
}

holdem::Deck make_deck(const std::optional<uint64_t>& seed) {
    return seed ? holdem::Deck(*seed) : holdem::Deck();
}

} // anonymous namespace

Table::Table(std::shared_ptr<holdem::StatsStore> store,
             holdem::TaskQueue& queue,
             int player_count,
             TableOptions options)
    : store_(std::move(store))
    , queue_(queue)
    , options_(options)
    , deck_(make_deck(options.deck_seed)) {
    stats_ = store_->load_stats();
    leaderboard_ = store_->load_leaderboard();
    if (init_players(player_count) != holdem::ActionOutcome::Applied) {
        holdem::log_warn(DOMAIN, "table_unseated", {{"player_count", player_count}});
    }
}

holdem::ActionOutcome Table::init_players(int count) {
    if (count < kMinPlayers || count > kMaxPlayers) {
        holdem::log_debug(DOMAIN, "init_players_ignored", {{"reason", "count_out_of_range"}, {"count", count}});
        return holdem::ActionOutcome::IllegalAction;
    }
    if (state_.hand_in_progress) {
        holdem::log_debug(DOMAIN, "init_players_ignored", {{"reason", "hand_in_progress"}});
        return holdem::ActionOutcome::HandInProgress;
    }

    poker::PlayersSeated event;
    event.set_buy_in(options_.buy_in);
    event.set_small_blind(options_.small_blind);
    event.set_big_blind(options_.big_blind);
    for (int i = 0; i < count; ++i) {
        auto* seat = event.add_seats();
        seat->set_seat(i);
        seat->set_name(i == 0 ? "You" : bot_names()[i - 1]);
        seat->set_is_human(i == 0);
    }
    apply(event);

    holdem::log_info(DOMAIN, "players_seated", {{"count", count}});
    emit_state();
    return holdem::ActionOutcome::Applied;
}

holdem::ActionOutcome Table::start_hand() {
    handlers::HandOpening opening;
    try {
        opening = handlers::handle_start_hand(state_, deck_);
    } catch (const holdem::ActionRejectedError& e) {
        holdem::log_debug(DOMAIN, "start_hand_ignored",
                          {{"reason", holdem::to_string(e.outcome)}, {"detail", e.what()}});
        return e.outcome;
    }

    apply(opening.started);
    for (const auto& blind : opening.blinds) {
        apply(blind);
    }
    apply(opening.dealt);

    holdem::log_info(DOMAIN, "hand_started", {
        {"hand_number", state_.hand_number},
        {"dealer", state_.dealer_index},
        {"small_blind_seat", state_.small_blind_seat},
        {"big_blind_seat", state_.big_blind_seat},
        {"action_on", state_.current_player_index}
    });
    emit_state();

    // Blinds can put every contender all-in before anyone acts.
    if (state_.is_betting_round_complete()) {
        advance_phase();
    }
    return holdem::ActionOutcome::Applied;
}

holdem::ActionOutcome Table::perform_action(poker::ActionType action, int64_t amount) {
    poker::PlayerAction cmd;
    cmd.set_seat(state_.current_player_index);
    cmd.set_action(action);
    cmd.set_amount(amount);
    return perform_action(cmd);
}

holdem::ActionOutcome Table::perform_action(const poker::PlayerAction& cmd) {
    poker::ActionTaken event;
    try {
        event = handlers::handle_action(cmd, state_);
    } catch (const holdem::ActionRejectedError& e) {
        holdem::log_debug(DOMAIN, "action_ignored", {
            {"seat", cmd.seat()},
            {"action", poker::ActionType_Name(cmd.action())},
            {"reason", holdem::to_string(e.outcome)},
            {"detail", e.what()}
        });
        return e.outcome;
    }

    apply(event);
    holdem::log_info(DOMAIN, "action_applied", {
        {"hand_number", state_.hand_number},
        {"seat", event.seat()},
        {"action", poker::ActionType_Name(event.action())},
        {"amount", event.amount()},
        {"bet_total", event.bet_total()},
        {"pot", event.pot_total()},
        {"all_in", event.all_in()}
    });

    after_action();
    return holdem::ActionOutcome::Applied;
}

void Table::after_action() {
    if (state_.players_in_hand().size() == 1) {
        finish_hand(handlers::handle_uncontested(state_));
        return;
    }

    if (state_.is_betting_round_complete()) {
        advance_phase();
        return;
    }

    poker::TurnAdvanced turn;
    turn.set_seat(state_.next_active_index(state_.current_player_index));
    apply(turn);
    emit_state();
}

void Table::advance_phase() {
    if (state_.phase == poker::RIVER) {
        poker::ShowdownStarted showdown;
        showdown.set_hand_number(state_.hand_number);
        *showdown.mutable_started_at() = google::protobuf::util::TimeUtil::GetCurrentTime();
        apply(showdown);
        finish_hand(handlers::handle_showdown(state_));
        return;
    }

    auto event = handlers::handle_deal_community(state_, deck_);
    apply(event);
    holdem::log_info(DOMAIN, "phase_advanced", {
        {"hand_number", state_.hand_number},
        {"phase", poker::BettingPhase_Name(state_.phase)},
        {"board", holdem::to_string(state_.community_cards)},
        {"action_on", state_.current_player_index}
    });
    emit_state();

    if (event.action_on() < 0) {
        schedule_deal_out();
    }
}

void Table::schedule_deal_out() {
    const int64_t hand = state_.hand_number;
    const poker::BettingPhase phase = state_.phase;
    queue_.schedule(
        options_.pacing,
        [this, hand, phase]() {
            return state_.hand_in_progress && state_.hand_number == hand && state_.phase == phase;
        },
        [this]() { advance_phase(); });
}

void Table::finish_hand(const std::pair<poker::PotAwarded, poker::HandComplete>& result) {
    const auto& [pot_event, complete_event] = result;
    apply(pot_event);
    apply(complete_event);

    stats_.hands_played++;
    if (complete_event.human_won()) {
        stats_.hands_won++;
    }
    stats_.total_profit += complete_event.profit();
    try {
        store_->save_stats(stats_);
    } catch (const std::exception& e) {
        holdem::log_error(DOMAIN, "stats_save_failed", {{"error", e.what()}});
    }

    std::vector<int> winners(complete_event.winners().begin(), complete_event.winners().end());
    holdem::log_info(DOMAIN, "hand_complete", {
        {"hand_number", complete_event.hand_number()},
        {"winners", winners},
        {"profit", complete_event.profit()},
        {"human_won", complete_event.human_won()},
        {"hands_played", stats_.hands_played}
    });

    last_result_ = complete_event;
    emit_state();
    for (const auto& listener : hand_complete_listeners_) {
        listener(complete_event);
    }
}

holdem::ActionOutcome Table::set_sitting_out(int seat, bool sitting_out) {
    if (state_.hand_in_progress) {
        return holdem::ActionOutcome::HandInProgress;
    }
    if (seat < 0 || seat >= static_cast<int>(state_.seats.size())) {
        return holdem::ActionOutcome::InvalidActor;
    }

    poker::SittingOutChanged event;
    event.set_seat(seat);
    event.set_sitting_out(sitting_out);
    apply(event);

    holdem::log_info(DOMAIN, "sitting_out_changed", {{"seat", seat}, {"sitting_out", sitting_out}});
    emit_state();
    return holdem::ActionOutcome::Applied;
}

void Table::add_to_leaderboard(holdem::LeaderboardEntry entry) {
    holdem::insert_leaderboard_entry(leaderboard_, std::move(entry));
    try {
        store_->save_leaderboard(leaderboard_);
    } catch (const std::exception& e) {
        holdem::log_error(DOMAIN, "leaderboard_save_failed", {{"error", e.what()}});
    }
}

poker::TableSnapshot Table::get_state() const {
    poker::TableSnapshot snapshot;

    for (const auto& seat : state_.seats) {
        auto* s = snapshot.add_seats();
        s->set_seat(seat.index);
        s->set_name(seat.name);
        s->set_is_human(seat.is_human);
        s->set_chips(seat.chips);
        s->set_bet(seat.bet);
        s->set_folded(seat.folded);
        s->set_all_in(seat.all_in);
        s->set_sitting_out(seat.sitting_out);
        for (const auto& card : seat.hand) {
            *s->add_hole_cards() = holdem::to_proto(card);
        }
        if (seat.hand_result) {
            *s->mutable_hand_result() = holdem::to_proto(*seat.hand_result);
        }
    }
    for (const auto& card : state_.community_cards) {
        *snapshot.add_community_cards() = holdem::to_proto(card);
    }

    snapshot.set_pot(state_.pot);
    snapshot.set_phase(state_.phase);
    snapshot.set_dealer_index(state_.dealer_index);
    snapshot.set_current_player_index(state_.current_player_index);
    snapshot.set_hand_number(state_.hand_number);
    for (auto action : state_.valid_actions()) {
        snapshot.add_valid_actions(action);
    }
    snapshot.set_call_amount(state_.call_amount());
    snapshot.set_min_raise_amount(state_.min_raise_total());
    snapshot.set_can_check(state_.can_check());
    snapshot.set_current_max_bet(state_.current_max_bet());
    snapshot.set_small_blind(state_.small_blind);
    snapshot.set_big_blind(state_.big_blind);
    snapshot.set_min_raise(state_.min_raise);
    snapshot.set_buy_in(state_.buy_in);
    return snapshot;
}

void Table::subscribe_state_change(StateChangeListener listener) {
    state_listeners_.push_back(std::move(listener));
}

void Table::subscribe_hand_complete(HandCompleteListener listener) {
    hand_complete_listeners_.push_back(std::move(listener));
}

void Table::emit_state() {
    for (const auto& listener : state_listeners_) {
        listener();
    }
}

} // namespace table
