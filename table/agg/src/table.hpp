#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include "table_state.hpp"
#include "holdem/aggregate.hpp"
#include "holdem/deck.hpp"
#include "holdem/errors.hpp"
#include "holdem/storage.hpp"
#include "holdem/task_queue.hpp"
#include "poker/table.pb.h"

namespace table {

struct TableOptions {
    int64_t small_blind = 1;
    int64_t big_blind = 2;
    int64_t buy_in = 200;
    std::chrono::milliseconds pacing{600};
    std::optional<uint64_t> deck_seed;
};

/// Single No-Limit Hold'em table.
///
/// Drives the hand from the blinds to the payout. Collaborators observe it
/// through get_state() and the subscriptions and change it only through
/// start_hand() and perform_action(). Rejected commands leave the table
/// untouched and report why through ActionOutcome.
///
/// All chips committed in a hand go into one pot that is split among the
/// showdown winners; there are no side pots.
class Table : public holdem::Aggregate<Table, TableState> {
public:
    static constexpr const char* DOMAIN = "table";
    static constexpr int kMinPlayers = 2;
    static constexpr int kMaxPlayers = 9;

    using Options = TableOptions;

    using StateChangeListener = std::function<void()>;
    using HandCompleteListener = std::function<void(const poker::HandComplete&)>;

    /// `queue` carries the all-in deal-out continuations and must outlive the table.
    /// An out-of-range `player_count` leaves the table with no seats.
    Table(std::shared_ptr<holdem::StatsStore> store,
          holdem::TaskQueue& queue,
          int player_count = 6,
          TableOptions options = TableOptions{});

    /// Seat 0 is the human, the rest are automated. A count outside
    /// [kMinPlayers, kMaxPlayers] is IllegalAction and keeps the current seats.
    holdem::ActionOutcome init_players(int count);

    holdem::ActionOutcome start_hand();

    holdem::ActionOutcome perform_action(const poker::PlayerAction& cmd);

    /// Acts for whichever seat is currently to act.
    holdem::ActionOutcome perform_action(poker::ActionType action, int64_t amount = 0);

    /// Only between hands.
    holdem::ActionOutcome set_sitting_out(int seat, bool sitting_out);

    poker::TableSnapshot get_state() const;

    const holdem::SessionStats& stats() const { return stats_; }
    const std::vector<holdem::LeaderboardEntry>& leaderboard() const { return leaderboard_; }
    const std::optional<poker::HandComplete>& last_hand_result() const { return last_result_; }

    void add_to_leaderboard(holdem::LeaderboardEntry entry);

    std::chrono::milliseconds pacing() const { return options_.pacing; }
    void set_pacing(std::chrono::milliseconds pacing) { options_.pacing = pacing; }

    void subscribe_state_change(StateChangeListener listener);
    void subscribe_hand_complete(HandCompleteListener listener);

protected:
    friend class holdem::Aggregate<Table, TableState>;

    void apply_event_impl(TableState& state, const google::protobuf::Any& event_any) {
        TableState::apply_event(state, event_any);
    }

private:
    void after_action();
    void advance_phase();
    void schedule_deal_out();
    void finish_hand(const std::pair<poker::PotAwarded, poker::HandComplete>& result);
    void emit_state();

    std::shared_ptr<holdem::StatsStore> store_;
    holdem::TaskQueue& queue_;
    Options options_;
    holdem::Deck deck_;
    holdem::SessionStats stats_;
    std::vector<holdem::LeaderboardEntry> leaderboard_;
    std::optional<poker::HandComplete> last_result_;
    std::vector<StateChangeListener> state_listeners_;
    std::vector<HandCompleteListener> hand_complete_listeners_;
};

} // namespace table
