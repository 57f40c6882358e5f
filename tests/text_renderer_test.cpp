#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "output_projector.hpp"
#include "text_renderer.hpp"
#include "holdem/card.hpp"

using namespace projector;

namespace {

poker::Card card(const std::string& text) {
    return holdem::to_proto(holdem::parse_card(text));
}

poker::TableSnapshot two_seat_snapshot(poker::BettingPhase phase) {
    poker::TableSnapshot snapshot;
    snapshot.set_phase(phase);
    snapshot.set_hand_number(3);
    snapshot.set_pot(12);
    auto* you = snapshot.add_seats();
    you->set_seat(0);
    you->set_name("You");
    you->set_chips(194);
    *you->add_hole_cards() = card("As");
    *you->add_hole_cards() = card("Kd");
    auto* alice = snapshot.add_seats();
    alice->set_seat(1);
    alice->set_name("Alice");
    alice->set_chips(194);
    *alice->add_hole_cards() = card("7c");
    *alice->add_hole_cards() = card("7h");
    return snapshot;
}

} // anonymous namespace

// =============================================================================
// TextRenderer Tests
// =============================================================================

TEST(TextRendererTest, RenderCard) {
    EXPECT_EQ(TextRenderer::render_card(card("As")), "A♠");
    EXPECT_EQ(TextRenderer::render_card(card("Th")), "T♥");
    EXPECT_EQ(TextRenderer::render_card(card("2c")), "2♣");
}

TEST(TextRendererTest, RenderActionTaken_ShouldUseSeatName) {
    TextRenderer renderer;
    renderer.set_player_name(2, "Bob");

    poker::ActionTaken raise;
    raise.set_seat(2);
    raise.set_action(poker::RAISE);
    raise.set_amount(10);
    raise.set_bet_total(12);
    EXPECT_EQ(renderer.render_action_taken(raise), "Bob raises to 12");

    poker::ActionTaken call;
    call.set_seat(4);
    call.set_action(poker::CALL);
    call.set_amount(5);
    call.set_all_in(true);
    EXPECT_EQ(renderer.render_action_taken(call), "Seat 4 calls 5 (all-in)");
}

TEST(TextRendererTest, RenderTable_ShouldHideOpponentCardsUntilShowdown) {
    TextRenderer renderer;

    auto during = renderer.render_table(two_seat_snapshot(poker::FLOP), 0);
    EXPECT_NE(during.find("A♠ K♦"), std::string::npos);
    EXPECT_EQ(during.find("7♣"), std::string::npos);

    auto after = renderer.render_table(two_seat_snapshot(poker::SHOWDOWN), 0);
    EXPECT_NE(after.find("7♣ 7♥"), std::string::npos);
}

TEST(TextRendererTest, RenderPrompt_ShouldListLegalActions) {
    TextRenderer renderer;
    poker::TableSnapshot snapshot;
    snapshot.add_valid_actions(poker::FOLD);
    snapshot.add_valid_actions(poker::CALL);
    snapshot.add_valid_actions(poker::RAISE);
    snapshot.set_call_amount(4);
    snapshot.set_min_raise_amount(8);

    auto prompt = renderer.render_prompt(snapshot);
    EXPECT_NE(prompt.find("[c]all 4"), std::string::npos);
    EXPECT_NE(prompt.find("min 8"), std::string::npos);
    EXPECT_EQ(prompt.find("check"), std::string::npos);
}

TEST(TextRendererTest, RenderPrompt_ShouldOfferRaisePresetsAndSpeed) {
    TextRenderer renderer;
    poker::TableSnapshot snapshot;
    snapshot.add_valid_actions(poker::FOLD);
    snapshot.add_valid_actions(poker::CHECK);
    snapshot.add_valid_actions(poker::RAISE);
    snapshot.set_min_raise_amount(2);

    auto prompt = renderer.render_prompt(snapshot);
    EXPECT_NE(prompt.find("half|pot|2x|allin"), std::string::npos);
    EXPECT_NE(prompt.find("[s]peed"), std::string::npos);
}

TEST(TextRendererTest, RaisePreset_ShouldSizeFromPotAndClamp) {
    // Given: pot 12 (current bets included), max bet 4, hero has 194 behind and 2 in
    auto snapshot = two_seat_snapshot(poker::PREFLOP);
    snapshot.set_current_max_bet(4);
    snapshot.set_min_raise_amount(6);
    snapshot.mutable_seats(0)->set_bet(2);

    EXPECT_EQ(TextRenderer::raise_preset(snapshot, 0, "half").value_or(-1), 10);
    EXPECT_EQ(TextRenderer::raise_preset(snapshot, 0, "pot").value_or(-1), 16);
    EXPECT_EQ(TextRenderer::raise_preset(snapshot, 0, "2x").value_or(-1), 28);
    EXPECT_EQ(TextRenderer::raise_preset(snapshot, 0, "allin").value_or(-1), 196);

    // When: the pot is tiny the minimum raise wins
    snapshot.set_pot(2);
    EXPECT_EQ(TextRenderer::raise_preset(snapshot, 0, "half").value_or(-1), 6);

    // When: the pot dwarfs the stack the raise is capped at all-in
    snapshot.set_pot(500);
    EXPECT_EQ(TextRenderer::raise_preset(snapshot, 0, "2x").value_or(-1), 196);

    EXPECT_FALSE(TextRenderer::raise_preset(snapshot, 0, "triple").has_value());
    EXPECT_FALSE(TextRenderer::raise_preset(snapshot, 7, "pot").has_value());
}

TEST(TextRendererTest, RenderStats_ShouldShowWinRateAndTopTen) {
    TextRenderer renderer;
    holdem::SessionStats stats;
    stats.hands_played = 8;
    stats.hands_won = 3;
    stats.total_profit = 42;

    std::vector<holdem::LeaderboardEntry> leaderboard;
    for (int i = 0; i < 12; ++i) {
        leaderboard.push_back({"2026-10-" + std::to_string(10 + i), 100 - i * 10});
    }

    auto text = renderer.render_stats(stats, leaderboard);
    EXPECT_NE(text.find("Hands: 8  Won: 3  Win Rate: 37.5%  Profit: +42"), std::string::npos);
    EXPECT_NE(text.find("1. 2026-10-10  +100"), std::string::npos);
    EXPECT_NE(text.find("10. 2026-10-19  +10"), std::string::npos);
    EXPECT_EQ(text.find("11."), std::string::npos);
}

TEST(TextRendererTest, RenderStats_NoHands_ShouldShowZeroRate) {
    TextRenderer renderer;
    holdem::SessionStats stats;
    stats.total_profit = -5;

    auto text = renderer.render_stats(stats, {});
    EXPECT_EQ(text, "Hands: 0  Won: 0  Win Rate: 0.0%  Profit: -5\n");
}

TEST(TextRendererTest, RenderShowdownStarted_ShouldNameHand) {
    TextRenderer renderer;
    poker::ShowdownStarted showdown;
    showdown.set_hand_number(14);
    EXPECT_EQ(renderer.render_showdown_started(showdown), "*** SHOWDOWN (hand #14) ***");
}

// =============================================================================
// OutputProjector Tests
// =============================================================================

TEST(OutputProjectorTest, ShouldRenderEventsAndLearnNames) {
    std::vector<std::string> lines;
    OutputProjector projector([&lines](const std::string& text) { lines.push_back(text); });

    poker::PlayersSeated seated;
    seated.set_buy_in(200);
    seated.set_small_blind(1);
    seated.set_big_blind(2);
    auto* seat = seated.add_seats();
    seat->set_seat(1);
    seat->set_name("Alice");
    google::protobuf::Any any;
    any.PackFrom(seated);
    projector.handle_event(any);

    poker::BlindPosted blind;
    blind.set_seat(1);
    blind.set_blind_type("big");
    blind.set_amount(2);
    any.PackFrom(blind);
    projector.handle_event(any);

    poker::TurnAdvanced turn;
    turn.set_seat(1);
    any.PackFrom(turn);
    projector.handle_event(any);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "1 players seated - 1/2 blinds, buy-in 200");
    EXPECT_EQ(lines[1], "Alice posts big blind: 2");
}

TEST(OutputProjectorTest, CardsDealt_ShouldOnlyRevealViewerCards) {
    std::vector<std::string> lines;
    OutputProjector projector([&lines](const std::string& text) { lines.push_back(text); }, 0);

    poker::CardsDealt dealt;
    auto* mine = dealt.add_player_cards();
    mine->set_seat(0);
    *mine->add_cards() = card("Qh");
    *mine->add_cards() = card("Qd");
    auto* theirs = dealt.add_player_cards();
    theirs->set_seat(1);
    *theirs->add_cards() = card("2s");
    *theirs->add_cards() = card("3s");
    google::protobuf::Any any;
    any.PackFrom(dealt);
    projector.handle_event(any);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("Your cards: [Q♥ Q♦]"), std::string::npos);
    EXPECT_EQ(lines[0].find("2♠"), std::string::npos);
}
