#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "holdem/storage.hpp"
#include "poker/poker_types.pb.h"
#include "poker/table.pb.h"

namespace projector {

/// Text renderer for table events and snapshots.
class TextRenderer {
public:
    TextRenderer() = default;

    /// Set display name for a seat.
    void set_player_name(int seat, const std::string& name);

    /// Get display name for a seat.
    std::string get_player_name(int seat) const;

    /// Render a card as text.
    static std::string render_card(const poker::Card& card);

    /// Render an action type as text.
    static std::string render_action(poker::ActionType action);

    // Event renderers
    std::string render_players_seated(const poker::PlayersSeated& event);
    std::string render_sitting_out_changed(const poker::SittingOutChanged& event);
    std::string render_hand_started(const poker::HandStarted& event);
    std::string render_blind_posted(const poker::BlindPosted& event);
    std::string render_cards_dealt(const poker::CardsDealt& event, int viewer_seat);
    std::string render_action_taken(const poker::ActionTaken& event);
    std::string render_community_cards_dealt(const poker::CommunityCardsDealt& event);
    std::string render_showdown_started(const poker::ShowdownStarted& event);
    std::string render_pot_awarded(const poker::PotAwarded& event);
    std::string render_hand_complete(const poker::HandComplete& event);

    /// Table view from `viewer_seat`'s point of view. Other hole cards stay
    /// hidden until the showdown.
    std::string render_table(const poker::TableSnapshot& snapshot, int viewer_seat) const;

    /// Prompt line listing the viewer's legal actions.
    std::string render_prompt(const poker::TableSnapshot& snapshot) const;

    /// Lifetime stats line followed by the best `top` leaderboard sessions.
    std::string render_stats(const holdem::SessionStats& stats,
                             const std::vector<holdem::LeaderboardEntry>& leaderboard,
                             std::size_t top = 10) const;

    /// Raise total for a named preset ("half", "pot", "2x", "allin"), clamped
    /// to [min_raise_amount, bet + chips] of `seat`. Empty for an unknown
    /// preset or seat.
    static std::optional<int64_t> raise_preset(const poker::TableSnapshot& snapshot,
                                               int seat,
                                               const std::string& preset);

private:
    std::unordered_map<int, std::string> player_names_;
};

} // namespace projector
