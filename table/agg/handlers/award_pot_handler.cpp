#include "award_pot_handler.hpp"
#include "holdem/errors.hpp"
#include "holdem/hand_evaluator.hpp"
#include <algorithm>
#include <chrono>
#include <google/protobuf/util/time_util.h>

namespace table {
namespace handlers {

namespace {

struct Contender {
    const Seat* seat;
    holdem::HandValue value;
};

std::pair<poker::PotAwarded, poker::HandComplete> build_award(
    const TableState& state,
    const std::vector<const Seat*>& winners,
    const std::vector<const Seat*>& ranked,
    const std::vector<Contender>& evaluated) {

    auto now = std::chrono::system_clock::now();
    auto timestamp = google::protobuf::util::TimeUtil::TimeTToTimestamp(
        std::chrono::system_clock::to_time_t(now));

    const int64_t count = static_cast<int64_t>(winners.size());
    const int64_t share = state.pot / count;
    const int64_t remainder = state.pot - share * count;

    // Build PotAwarded event
    poker::PotAwarded pot_event;
    *pot_event.mutable_awarded_at() = timestamp;
    for (std::size_t i = 0; i < winners.size(); ++i) {
        auto* award = pot_event.add_winners();
        award->set_seat(winners[i]->index);
        award->set_amount(share + (i == 0 ? remainder : 0));
    }
    for (const auto& c : evaluated) {
        auto* hand = pot_event.add_hands();
        hand->set_seat(c.seat->index);
        *hand->mutable_result() = holdem::to_proto(c.value);
    }

    // Build HandComplete event
    poker::HandComplete complete_event;
    complete_event.set_hand_number(state.hand_number);
    *complete_event.mutable_completed_at() = timestamp;
    for (const auto* seat : winners) {
        complete_event.add_winners(seat->index);
    }
    for (const auto* seat : ranked) {
        complete_event.add_ranked(seat->index);
    }
    for (const auto& award : pot_event.winners()) {
        *complete_event.add_awards() = award;
    }

    // Profit is the human seat's stack after the payout against the buy-in.
    for (const auto& seat : state.seats) {
        if (!seat.is_human) {
            continue;
        }
        int64_t winnings = 0;
        for (const auto& award : pot_event.winners()) {
            if (award.seat() == seat.index) {
                winnings += award.amount();
            }
        }
        bool won = std::any_of(winners.begin(), winners.end(),
                               [&](const Seat* w) { return w->index == seat.index; });
        complete_event.set_profit(seat.chips + winnings - state.buy_in);
        complete_event.set_human_won(won);
        break;
    }

    return {pot_event, complete_event};
}

} // anonymous namespace

std::pair<poker::PotAwarded, poker::HandComplete> handle_showdown(const TableState& state) {

    // Guard
    if (!state.hand_in_progress) {
        throw holdem::ActionRejectedError::no_hand_in_progress("No hand in progress");
    }

    auto in_hand = state.players_in_hand();
    if (in_hand.empty()) {
        throw holdem::ActionRejectedError::illegal_action("No contenders left");
    }

    // Compute
    std::vector<Contender> contenders;
    for (const auto* seat : in_hand) {
        std::vector<holdem::Card> cards = seat->hand;
        cards.insert(cards.end(), state.community_cards.begin(), state.community_cards.end());
        contenders.push_back({seat, holdem::evaluate_hand(cards)});
    }

    // Best first; equal hands keep seat order.
    std::vector<Contender> ranked_contenders = contenders;
    std::stable_sort(ranked_contenders.begin(), ranked_contenders.end(),
                     [](const Contender& a, const Contender& b) {
                         return holdem::compare_hands(a.value, b.value) > 0;
                     });

    std::vector<const Seat*> ranked;
    std::vector<const Seat*> winners;
    for (const auto& c : ranked_contenders) {
        ranked.push_back(c.seat);
        if (holdem::compare_hands(c.value, ranked_contenders.front().value) == 0) {
            winners.push_back(c.seat);
        }
    }

    return build_award(state, winners, ranked, contenders);
}

std::pair<poker::PotAwarded, poker::HandComplete> handle_uncontested(const TableState& state) {

    // Guard
    if (!state.hand_in_progress) {
        throw holdem::ActionRejectedError::no_hand_in_progress("No hand in progress");
    }

    auto in_hand = state.players_in_hand();
    if (in_hand.size() != 1) {
        throw holdem::ActionRejectedError::illegal_action(
            "Pot is contested by " + std::to_string(in_hand.size()) + " players");
    }

    return build_award(state, in_hand, in_hand, {});
}

} // namespace handlers
} // namespace table
