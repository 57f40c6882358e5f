#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "table_state.hpp"
#include "action_handler.hpp"
#include "award_pot_handler.hpp"
#include "deal_community_handler.hpp"
#include "start_hand_handler.hpp"
#include "holdem/card.hpp"
#include "holdem/deck.hpp"
#include "holdem/errors.hpp"

using namespace table;

namespace {

template<typename EventType>
void apply(TableState& state, const EventType& event) {
    google::protobuf::Any any;
    any.PackFrom(event);
    TableState::apply_event(state, any);
}

poker::PlayersSeated seated(int count, int64_t buy_in = 200) {
    poker::PlayersSeated event;
    event.set_buy_in(buy_in);
    event.set_small_blind(1);
    event.set_big_blind(2);
    for (int i = 0; i < count; ++i) {
        auto* seat = event.add_seats();
        seat->set_seat(i);
        seat->set_name(i == 0 ? "You" : "Bot" + std::to_string(i));
        seat->set_is_human(i == 0);
    }
    return event;
}

/// A table whose betting round is open, built directly on the state.
TableState betting_state(int count) {
    TableState state;
    apply(state, seated(count));
    state.hand_in_progress = true;
    state.phase = poker::PREFLOP;
    state.current_player_index = 0;
    return state;
}

holdem::ActionOutcome rejection(const poker::PlayerAction& cmd, const TableState& state) {
    try {
        handlers::handle_action(cmd, state);
    } catch (const holdem::ActionRejectedError& e) {
        return e.outcome;
    }
    return holdem::ActionOutcome::Applied;
}

poker::PlayerAction action(int seat, poker::ActionType type, int64_t amount = 0) {
    poker::PlayerAction cmd;
    cmd.set_seat(seat);
    cmd.set_action(type);
    cmd.set_amount(amount);
    return cmd;
}

} // anonymous namespace

// =============================================================================
// Start Hand Handler Tests
// =============================================================================

TEST(StartHandHandlerTest, ShouldPostBlindsAfterDealer) {
    TableState state;
    apply(state, seated(4));
    holdem::Deck deck(1);

    auto opening = handlers::handle_start_hand(state, deck);

    EXPECT_EQ(opening.started.hand_number(), 1);
    EXPECT_EQ(opening.started.dealer_index(), 0);
    ASSERT_EQ(opening.blinds.size(), 2u);
    EXPECT_EQ(opening.blinds[0].seat(), 1);
    EXPECT_EQ(opening.blinds[0].amount(), 1);
    EXPECT_EQ(opening.blinds[1].seat(), 2);
    EXPECT_EQ(opening.blinds[1].amount(), 2);
    EXPECT_EQ(opening.blinds[1].pot_total(), 3);
    EXPECT_EQ(opening.dealt.player_cards_size(), 4);
    EXPECT_EQ(opening.dealt.action_on(), 3);
    EXPECT_EQ(deck.size(), 52u - 8u);
}

TEST(StartHandHandlerTest, HeadsUp_DealerShouldPostSmallBlindAndAct) {
    TableState state;
    apply(state, seated(2));
    holdem::Deck deck(1);

    auto opening = handlers::handle_start_hand(state, deck);

    EXPECT_EQ(opening.started.small_blind_seat(), 0);
    EXPECT_EQ(opening.started.big_blind_seat(), 1);
    EXPECT_EQ(opening.dealt.action_on(), 0);
}

TEST(StartHandHandlerTest, SittingOutSeats_ShouldBeSkipped) {
    TableState state;
    apply(state, seated(4));
    poker::SittingOutChanged out;
    out.set_seat(1);
    out.set_sitting_out(true);
    apply(state, out);
    holdem::Deck deck(1);

    auto opening = handlers::handle_start_hand(state, deck);

    EXPECT_EQ(opening.started.small_blind_seat(), 2);
    EXPECT_EQ(opening.started.big_blind_seat(), 3);
    EXPECT_EQ(opening.dealt.player_cards_size(), 3);
    EXPECT_EQ(opening.dealt.action_on(), 0);
}

TEST(StartHandHandlerTest, ShortBuyIn_ShouldPutBigBlindAllIn) {
    TableState state;
    apply(state, seated(3, 2));
    holdem::Deck deck(1);

    auto opening = handlers::handle_start_hand(state, deck);

    EXPECT_FALSE(opening.blinds[0].all_in());
    EXPECT_TRUE(opening.blinds[1].all_in());
    EXPECT_EQ(opening.blinds[1].player_stack(), 0);
}

TEST(StartHandHandlerTest, ShouldRejectWhileHandInProgress) {
    TableState state;
    apply(state, seated(3));
    state.hand_in_progress = true;
    holdem::Deck deck(1);

    try {
        handlers::handle_start_hand(state, deck);
        FAIL() << "Expected ActionRejectedError";
    } catch (const holdem::ActionRejectedError& e) {
        EXPECT_EQ(e.outcome, holdem::ActionOutcome::HandInProgress);
    }
}

// =============================================================================
// Action Handler Tests
// =============================================================================

TEST(ActionHandlerTest, Rejections_ShouldCarryReason) {
    auto state = betting_state(3);
    state.seats[1].bet = 2;

    EXPECT_EQ(rejection(action(1, poker::CALL), state), holdem::ActionOutcome::InvalidActor);
    EXPECT_EQ(rejection(action(0, poker::CHECK), state), holdem::ActionOutcome::IllegalAction);

    state.seats[0].folded = true;
    EXPECT_EQ(rejection(action(0, poker::CALL), state), holdem::ActionOutcome::PlayerCannotAct);

    state.seats[0].folded = false;
    state.seats[0].all_in = true;
    EXPECT_EQ(rejection(action(0, poker::CALL), state), holdem::ActionOutcome::PlayerCannotAct);

    state.hand_in_progress = false;
    EXPECT_EQ(rejection(action(0, poker::CALL), state), holdem::ActionOutcome::NoHandInProgress);
}

TEST(ActionHandlerTest, Call_ShouldCapAtStack) {
    auto state = betting_state(2);
    state.seats[1].bet = 150;
    state.seats[0].chips = 40;

    auto event = handlers::handle_action(action(0, poker::CALL), state);

    EXPECT_EQ(event.amount(), 40);
    EXPECT_EQ(event.player_stack(), 0);
    EXPECT_TRUE(event.all_in());
}

TEST(ActionHandlerTest, Raise_ShouldClampIntoLegalRange) {
    auto state = betting_state(2);
    state.seats[1].bet = 10;
    state.pot = 10;

    auto huge = handlers::handle_action(action(0, poker::RAISE, 5000), state);
    EXPECT_EQ(huge.bet_total(), 200);
    EXPECT_TRUE(huge.all_in());
    EXPECT_TRUE(huge.reopened());
    EXPECT_EQ(huge.min_raise(), 190);
    EXPECT_EQ(huge.pot_total(), 210);

    auto tiny = handlers::handle_action(action(0, poker::RAISE, 3), state);
    EXPECT_EQ(tiny.bet_total(), 10);
    EXPECT_EQ(tiny.amount(), 10);
    EXPECT_FALSE(tiny.reopened());
}

// =============================================================================
// Event Application Tests
// =============================================================================

TEST(TableStateTest, ReopeningRaise_ShouldClearOtherActedFlags) {
    auto state = betting_state(3);
    for (auto& seat : state.seats) {
        seat.has_acted = true;
        seat.bet = 2;
    }
    state.pot = 6;

    poker::ActionTaken raise;
    raise.set_seat(2);
    raise.set_action(poker::RAISE);
    raise.set_amount(6);
    raise.set_bet_total(8);
    raise.set_player_stack(192);
    raise.set_pot_total(12);
    raise.set_reopened(true);
    raise.set_min_raise(6);
    apply(state, raise);

    EXPECT_FALSE(state.seats[0].has_acted);
    EXPECT_FALSE(state.seats[1].has_acted);
    EXPECT_TRUE(state.seats[2].has_acted);
    EXPECT_EQ(state.min_raise, 6);
    EXPECT_FALSE(state.is_betting_round_complete());
}

TEST(TableStateTest, CommunityCards_ShouldNotBeTakenForHoleCards) {
    auto state = betting_state(2);

    poker::CommunityCardsDealt flop;
    flop.set_phase(poker::FLOP);
    for (const auto& card : holdem::parse_cards("2c 3d 4h")) {
        *flop.add_cards() = holdem::to_proto(card);
    }
    flop.set_action_on(1);
    apply(state, flop);

    EXPECT_EQ(state.community_cards.size(), 3u);
    EXPECT_TRUE(state.seats[0].hand.empty());
    EXPECT_EQ(state.phase, poker::FLOP);
    EXPECT_EQ(state.current_player_index, 1);
}

TEST(TableStateTest, ValidActions_ShouldFollowBetFacingSeat) {
    auto state = betting_state(2);
    state.seats[1].bet = 2;

    auto facing = state.valid_actions();
    EXPECT_EQ(facing, (std::vector<poker::ActionType>{poker::FOLD, poker::CALL, poker::RAISE}));
    EXPECT_EQ(state.call_amount(), 2);
    EXPECT_EQ(state.min_raise_total(), 4);
    EXPECT_FALSE(state.can_check());

    state.seats[0].bet = 2;
    EXPECT_EQ(state.valid_actions(),
              (std::vector<poker::ActionType>{poker::FOLD, poker::CHECK, poker::RAISE}));
    EXPECT_TRUE(state.can_check());
}

TEST(TableStateTest, ShortStack_ShouldNotBeOfferedRaise) {
    auto state = betting_state(2);
    state.seats[1].bet = 100;
    state.seats[0].chips = 60;

    EXPECT_EQ(state.valid_actions(), (std::vector<poker::ActionType>{poker::FOLD, poker::CALL}));
    EXPECT_EQ(state.call_amount(), 60);
}

// =============================================================================
// Deal Community Handler Tests
// =============================================================================

TEST(DealCommunityHandlerTest, Flop_ShouldDealThreeAndActAfterDealer) {
    auto state = betting_state(3);
    holdem::Deck deck(5);

    auto event = handlers::handle_deal_community(state, deck);

    EXPECT_EQ(event.phase(), poker::FLOP);
    EXPECT_EQ(event.cards_size(), 3);
    EXPECT_EQ(event.all_community_cards_size(), 3);
    EXPECT_EQ(event.action_on(), 1);
}

TEST(DealCommunityHandlerTest, AllInContenders_ShouldLeaveNobodyToAct) {
    auto state = betting_state(3);
    state.phase = poker::FLOP;
    state.community_cards = holdem::parse_cards("2c 3d 4h");
    state.seats[0].all_in = true;
    state.seats[1].folded = true;
    holdem::Deck deck(5);

    auto event = handlers::handle_deal_community(state, deck);

    EXPECT_EQ(event.phase(), poker::TURN);
    EXPECT_EQ(event.cards_size(), 1);
    EXPECT_EQ(event.all_community_cards_size(), 4);
    EXPECT_EQ(event.action_on(), -1);
}

// =============================================================================
// Award Pot Handler Tests
// =============================================================================

TEST(AwardPotHandlerTest, SplitPot_ShouldGiveRemainderToFirstWinner) {
    // Given a board that plays for both contenders and an odd pot
    auto state = betting_state(3);
    state.phase = poker::SHOWDOWN;
    state.community_cards = holdem::parse_cards("As Ks Qs Js Ts");
    state.seats[0].hand = holdem::parse_cards("2c 3d");
    state.seats[1].hand = holdem::parse_cards("2d 3c");
    state.seats[2].folded = true;
    state.seats[0].chips = 198;
    state.seats[1].chips = 197;
    state.pot = 5;

    // When the showdown is resolved
    auto [pot_event, complete] = handlers::handle_showdown(state);

    // Then both seats win and the odd chip goes to the first
    ASSERT_EQ(pot_event.winners_size(), 2);
    EXPECT_EQ(pot_event.winners(0).seat(), 0);
    EXPECT_EQ(pot_event.winners(0).amount(), 3);
    EXPECT_EQ(pot_event.winners(1).seat(), 1);
    EXPECT_EQ(pot_event.winners(1).amount(), 2);
    EXPECT_EQ(pot_event.hands_size(), 2);
    EXPECT_EQ(complete.ranked_size(), 2);
    EXPECT_TRUE(complete.human_won());
    EXPECT_EQ(complete.profit(), 198 + 3 - 200);
}

TEST(AwardPotHandlerTest, Showdown_ShouldRankBestFirst) {
    auto state = betting_state(3);
    state.phase = poker::SHOWDOWN;
    state.community_cards = holdem::parse_cards("Kd 9c 7h 4s 2d");
    state.seats[0].hand = holdem::parse_cards("3c 5d");
    state.seats[1].hand = holdem::parse_cards("Kh Qc");
    state.seats[2].hand = holdem::parse_cards("9d 9h");
    state.pot = 30;

    auto [pot_event, complete] = handlers::handle_showdown(state);

    ASSERT_EQ(complete.winners_size(), 1);
    EXPECT_EQ(complete.winners(0), 2);
    ASSERT_EQ(complete.ranked_size(), 3);
    EXPECT_EQ(complete.ranked(0), 2);
    EXPECT_EQ(complete.ranked(1), 1);
    EXPECT_EQ(complete.ranked(2), 0);
    EXPECT_EQ(pot_event.winners(0).amount(), 30);
    EXPECT_FALSE(complete.human_won());
}

TEST(AwardPotHandlerTest, Uncontested_ShouldRequireSingleContender) {
    auto state = betting_state(3);
    state.pot = 3;

    EXPECT_THROW(handlers::handle_uncontested(state), holdem::ActionRejectedError);

    state.seats[0].folded = true;
    state.seats[1].folded = true;
    auto [pot_event, complete] = handlers::handle_uncontested(state);
    EXPECT_EQ(pot_event.winners(0).seat(), 2);
    EXPECT_EQ(pot_event.winners(0).amount(), 3);
    EXPECT_EQ(pot_event.hands_size(), 0);
}
