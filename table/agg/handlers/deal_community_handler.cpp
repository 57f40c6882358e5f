#include "deal_community_handler.hpp"
#include "holdem/errors.hpp"
#include <chrono>
#include <google/protobuf/util/time_util.h>

namespace table {
namespace handlers {

namespace {

struct PhaseTransition {
    poker::BettingPhase next_phase;
    int cards_to_deal;
};

PhaseTransition get_next_phase(poker::BettingPhase current) {
    switch (current) {
        case poker::PREFLOP:
            return {poker::FLOP, 3};
        case poker::FLOP:
            return {poker::TURN, 1};
        case poker::TURN:
            return {poker::RIVER, 1};
        default:
            return {poker::WAITING, 0};
    }
}

} // anonymous namespace

poker::CommunityCardsDealt handle_deal_community(
    const TableState& state,
    holdem::Deck& deck) {

    // Guard
    if (!state.hand_in_progress) {
        throw holdem::ActionRejectedError::no_hand_in_progress("No hand in progress");
    }

    auto transition = get_next_phase(state.phase);
    if (transition.cards_to_deal == 0) {
        throw holdem::ActionRejectedError::illegal_action(
            "No community cards follow " + poker::BettingPhase_Name(state.phase));
    }

    // Compute
    auto now = std::chrono::system_clock::now();
    auto timestamp = google::protobuf::util::TimeUtil::TimeTToTimestamp(
        std::chrono::system_clock::to_time_t(now));

    poker::CommunityCardsDealt event;
    event.set_phase(transition.next_phase);
    *event.mutable_dealt_at() = timestamp;

    for (const auto& card : state.community_cards) {
        *event.add_all_community_cards() = holdem::to_proto(card);
    }
    for (int i = 0; i < transition.cards_to_deal; ++i) {
        auto card = holdem::to_proto(deck.draw());
        *event.add_cards() = card;
        *event.add_all_community_cards() = card;
    }

    // Nobody is asked to act once fewer than two contenders have chips behind.
    if (state.players_still_acting().size() >= 2) {
        event.set_action_on(state.next_active_index(state.dealer_index));
    } else {
        event.set_action_on(-1);
    }

    return event;
}

} // namespace handlers
} // namespace table
