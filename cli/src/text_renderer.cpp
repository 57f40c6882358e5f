#include "text_renderer.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "holdem/hand_evaluator.hpp"

namespace projector {

namespace {

std::string render_cards(const google::protobuf::RepeatedPtrField<poker::Card>& cards) {
    std::stringstream ss;
    bool first = true;
    for (const auto& card : cards) {
        if (!first) ss << " ";
        ss << TextRenderer::render_card(card);
        first = false;
    }
    return ss.str();
}

const char* phase_name(poker::BettingPhase phase) {
    switch (phase) {
        case poker::PREFLOP: return "PREFLOP";
        case poker::FLOP: return "FLOP";
        case poker::TURN: return "TURN";
        case poker::RIVER: return "RIVER";
        case poker::SHOWDOWN: return "SHOWDOWN";
        default: return "WAITING";
    }
}

} // anonymous namespace

void TextRenderer::set_player_name(int seat, const std::string& name) {
    player_names_[seat] = name;
}

std::string TextRenderer::get_player_name(int seat) const {
    auto it = player_names_.find(seat);
    if (it != player_names_.end()) {
        return it->second;
    }
    return "Seat " + std::to_string(seat);
}

std::string TextRenderer::render_card(const poker::Card& card) {
    std::string rank;
    if (card.rank() == 14) rank = "A";
    else if (card.rank() == 13) rank = "K";
    else if (card.rank() == 12) rank = "Q";
    else if (card.rank() == 11) rank = "J";
    else if (card.rank() == 10) rank = "T";
    else rank = std::to_string(card.rank());

    std::string suit;
    switch (card.suit()) {
        case poker::SPADES: suit = "♠"; break;
        case poker::HEARTS: suit = "♥"; break;
        case poker::DIAMONDS: suit = "♦"; break;
        case poker::CLUBS: suit = "♣"; break;
        default: suit = "?"; break;
    }

    return rank + suit;
}

std::string TextRenderer::render_action(poker::ActionType action) {
    switch (action) {
        case poker::FOLD: return "folds";
        case poker::CHECK: return "checks";
        case poker::CALL: return "calls";
        case poker::RAISE: return "raises to";
        default: return "unknown";
    }
}

std::string TextRenderer::render_players_seated(const poker::PlayersSeated& event) {
    for (const auto& seat : event.seats()) {
        set_player_name(seat.seat(), seat.name());
    }
    std::stringstream ss;
    ss << event.seats_size() << " players seated - "
       << event.small_blind() << "/" << event.big_blind() << " blinds, "
       << "buy-in " << event.buy_in();
    return ss.str();
}

std::string TextRenderer::render_sitting_out_changed(const poker::SittingOutChanged& event) {
    return get_player_name(event.seat()) + (event.sitting_out() ? " sits out" : " is back");
}

std::string TextRenderer::render_hand_started(const poker::HandStarted& event) {
    std::stringstream ss;
    ss << "=== Hand #" << event.hand_number() << " ===\n"
       << "Dealer: " << get_player_name(event.dealer_index());
    return ss.str();
}

std::string TextRenderer::render_blind_posted(const poker::BlindPosted& event) {
    std::stringstream ss;
    ss << get_player_name(event.seat()) << " posts "
       << event.blind_type() << " blind: " << event.amount();
    if (event.all_in()) {
        ss << " (all-in)";
    }
    return ss.str();
}

std::string TextRenderer::render_cards_dealt(const poker::CardsDealt& event, int viewer_seat) {
    std::stringstream ss;
    ss << "Cards dealt to " << event.player_cards_size() << " players";
    for (const auto& hole : event.player_cards()) {
        if (hole.seat() == viewer_seat) {
            ss << "\nYour cards: [" << render_cards(hole.cards()) << "]";
        }
    }
    return ss.str();
}

std::string TextRenderer::render_action_taken(const poker::ActionTaken& event) {
    std::stringstream ss;
    ss << get_player_name(event.seat()) << " " << render_action(event.action());
    if (event.action() == poker::RAISE) {
        ss << " " << event.bet_total();
    } else if (event.amount() > 0) {
        ss << " " << event.amount();
    }
    if (event.all_in()) {
        ss << " (all-in)";
    }
    return ss.str();
}

std::string TextRenderer::render_community_cards_dealt(const poker::CommunityCardsDealt& event) {
    std::stringstream ss;
    ss << "*** ";
    switch (event.phase()) {
        case poker::FLOP: ss << "FLOP"; break;
        case poker::TURN: ss << "TURN"; break;
        case poker::RIVER: ss << "RIVER"; break;
        default: ss << "COMMUNITY"; break;
    }
    ss << " *** [" << render_cards(event.all_community_cards()) << "]";
    return ss.str();
}

std::string TextRenderer::render_showdown_started(const poker::ShowdownStarted& event) {
    return "*** SHOWDOWN (hand #" + std::to_string(event.hand_number()) + ") ***";
}

std::string TextRenderer::render_pot_awarded(const poker::PotAwarded& event) {
    std::stringstream ss;
    for (const auto& hand : event.hands()) {
        ss << get_player_name(hand.seat()) << " shows [" << render_cards(hand.result().best_cards())
           << "] " << holdem::hand_name(hand.result().category()) << "\n";
    }
    ss << "*** POT AWARDED ***\n";
    for (const auto& winner : event.winners()) {
        ss << get_player_name(winner.seat()) << " wins " << winner.amount() << "\n";
    }
    return ss.str();
}

std::string TextRenderer::render_hand_complete(const poker::HandComplete& event) {
    std::stringstream ss;
    ss << "=== Hand Complete ===\n";
    ss << (event.human_won() ? "You win! " : "") << "Net this hand: ";
    if (event.profit() > 0) ss << "+";
    ss << event.profit();
    return ss.str();
}

std::string TextRenderer::render_table(const poker::TableSnapshot& snapshot, int viewer_seat) const {
    std::stringstream ss;
    ss << "Hand #" << snapshot.hand_number() << "  " << phase_name(snapshot.phase())
       << "  Pot: " << snapshot.pot() << "\n";
    ss << "Board: [" << render_cards(snapshot.community_cards()) << "]\n";

    const bool reveal = snapshot.phase() == poker::SHOWDOWN;
    for (const auto& seat : snapshot.seats()) {
        ss << (seat.seat() == snapshot.current_player_index() ? "> " : "  ")
           << (seat.seat() == snapshot.dealer_index() ? "(D) " : "    ")
           << seat.name() << ": " << seat.chips();
        if (seat.bet() > 0) {
            ss << "  bet " << seat.bet();
        }
        if (seat.sitting_out()) {
            ss << "  [sitting out]";
        } else if (seat.folded()) {
            ss << "  [folded]";
        } else if (seat.all_in()) {
            ss << "  [all-in]";
        }
        if (seat.hole_cards_size() > 0 && (seat.seat() == viewer_seat || (reveal && !seat.folded()))) {
            ss << "  [" << render_cards(seat.hole_cards()) << "]";
        }
        ss << "\n";
    }
    return ss.str();
}

std::string TextRenderer::render_prompt(const poker::TableSnapshot& snapshot) const {
    std::stringstream ss;
    ss << "Your move:";
    for (auto action : snapshot.valid_actions()) {
        switch (action) {
            case poker::FOLD: ss << " [f]old"; break;
            case poker::CHECK: ss << " [c]heck"; break;
            case poker::CALL: ss << " [c]all " << snapshot.call_amount(); break;
            case poker::RAISE:
                ss << " [r]aise <total|half|pot|2x|allin> (min " << snapshot.min_raise_amount() << ")";
                break;
            default: break;
        }
    }
    ss << " [s]peed <0|1|2> [q]uit";
    return ss.str();
}

std::string TextRenderer::render_stats(const holdem::SessionStats& stats,
                                       const std::vector<holdem::LeaderboardEntry>& leaderboard,
                                       std::size_t top) const {
    const double win_rate = stats.hands_played > 0
        ? 100.0 * static_cast<double>(stats.hands_won) / static_cast<double>(stats.hands_played)
        : 0.0;

    std::stringstream ss;
    ss << "Hands: " << stats.hands_played
       << "  Won: " << stats.hands_won
       << "  Win Rate: " << std::fixed << std::setprecision(1) << win_rate << "%"
       << "  Profit: " << (stats.total_profit >= 0 ? "+" : "") << stats.total_profit << "\n";

    if (leaderboard.empty()) {
        return ss.str();
    }
    ss << "Leaderboard:\n";
    const std::size_t shown = std::min(top, leaderboard.size());
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& entry = leaderboard[i];
        ss << "  " << (i + 1) << ". " << entry.date << "  "
           << (entry.profit >= 0 ? "+" : "") << entry.profit << "\n";
    }
    return ss.str();
}

std::optional<int64_t> TextRenderer::raise_preset(const poker::TableSnapshot& snapshot,
                                                  int seat,
                                                  const std::string& preset) {
    auto it = std::find_if(snapshot.seats().begin(), snapshot.seats().end(),
        [seat](const poker::SeatSnapshot& s) { return s.seat() == seat; });
    if (it == snapshot.seats().end()) {
        return std::nullopt;
    }

    const int64_t pot = snapshot.pot();
    const int64_t max_bet = snapshot.current_max_bet();
    const int64_t all_in = it->bet() + it->chips();

    int64_t total;
    if (preset == "half") {
        total = max_bet + pot / 2;
    } else if (preset == "pot") {
        total = max_bet + pot;
    } else if (preset == "2x") {
        total = max_bet + pot * 2;
    } else if (preset == "allin") {
        total = all_in;
    } else {
        return std::nullopt;
    }
    return std::min(std::max(total, snapshot.min_raise_amount()), all_in);
}

} // namespace projector
