#include "ai_player.hpp"
#include <algorithm>
#include <map>
#include <random>
#include <set>
#include "holdem/hand_evaluator.hpp"

namespace ai {

namespace {

double clamp_unit(double value) {
    return std::max(0.0, std::min(1.0, value));
}

double base_strength(poker::HandCategory category) {
    switch (category) {
        case poker::HIGH_CARD: return 0.15;
        case poker::PAIR: return 0.35;
        case poker::TWO_PAIR: return 0.55;
        case poker::THREE_OF_A_KIND: return 0.7;
        case poker::STRAIGHT: return 0.78;
        case poker::FLUSH: return 0.83;
        case poker::FULL_HOUSE: return 0.9;
        case poker::FOUR_OF_A_KIND: return 0.96;
        case poker::STRAIGHT_FLUSH: return 0.98;
        case poker::ROYAL_FLUSH: return 1.0;
        default: return 0.1;
    }
}

std::vector<holdem::Card> to_cards(
    const google::protobuf::RepeatedPtrField<poker::Card>& cards) {
    std::vector<holdem::Card> result;
    result.reserve(cards.size());
    for (const auto& card : cards) {
        result.push_back(holdem::from_proto(card));
    }
    return result;
}

bool has_action(const poker::TableSnapshot& snapshot, poker::ActionType action) {
    return std::find(snapshot.valid_actions().begin(), snapshot.valid_actions().end(), action) !=
           snapshot.valid_actions().end();
}

AiPlayer::UniformSource make_source(uint64_t seed) {
    return [engine = std::mt19937_64(seed),
            dist = std::uniform_real_distribution<double>(0.0, 1.0)]() mutable {
        return dist(engine);
    };
}

} // anonymous namespace

double preflop_strength(const holdem::Card& first, const holdem::Card& second) {
    const int high = std::max(first.rank, second.rank);
    const int low = std::min(first.rank, second.rank);
    const int gap = high - low;
    const bool pair = gap == 0;

    // Ranks scaled so that deuce is 0 and ace is 12.
    const double high_value = high - holdem::kLowestRank;
    const double low_value = low - holdem::kLowestRank;

    double strength;
    if (pair) {
        strength = 0.5 + (high_value / 12.0) * 0.5;
    } else {
        strength = (high_value + low_value) / 24.0 * 0.6;
        if (first.suit == second.suit) {
            strength += 0.06;
        }
        if (gap == 1) {
            strength += 0.04;
        } else if (gap == 2) {
            strength += 0.02;
        }
        if (gap > 4) {
            strength -= 0.05;
        }
    }

    // Premium holdings.
    if (pair && high >= 10) {
        strength = std::max(strength, 0.85);
    }
    if (high == 14 && low >= 11) {
        strength = std::max(strength, 0.75);
    }
    if (high == 14 && low == 13) {
        strength = std::max(strength, 0.8);
    }

    return clamp_unit(strength);
}

double postflop_strength(const std::vector<holdem::Card>& hole,
                         const std::vector<holdem::Card>& community) {
    std::vector<holdem::Card> all_cards(hole);
    all_cards.insert(all_cards.end(), community.begin(), community.end());
    auto value = holdem::evaluate_hand(all_cards);

    double strength = base_strength(value.category);

    if (value.category == poker::PAIR) {
        std::map<int, int> board_counts;
        int board_high = 0;
        for (const auto& card : community) {
            board_counts[card.rank]++;
            board_high = std::max(board_high, card.rank);
        }
        bool board_paired = std::any_of(board_counts.begin(), board_counts.end(),
            [](const auto& entry) { return entry.second >= 2; });
        bool hole_connects = std::any_of(hole.begin(), hole.end(),
            [&](const holdem::Card& card) { return board_counts.count(card.rank) > 0; });
        if (board_paired && !hole_connects) {
            strength -= 0.1;
        }

        bool top_pair = std::any_of(hole.begin(), hole.end(),
            [&](const holdem::Card& card) { return card.rank >= board_high; });
        if (top_pair) {
            strength += 0.08;
        }
    }

    if (value.category < poker::STRAIGHT && community.size() < 5) {
        std::map<poker::Suit, int> suit_counts;
        for (const auto& card : all_cards) {
            suit_counts[card.suit]++;
        }
        bool flush_draw = std::any_of(suit_counts.begin(), suit_counts.end(),
            [](const auto& entry) { return entry.second == 4; });
        if (flush_draw) {
            strength += 0.1;
        }

        std::set<int> ranks_set;
        for (const auto& card : all_cards) {
            ranks_set.insert(card.rank);
        }
        std::vector<int> ranks(ranks_set.begin(), ranks_set.end());
        for (std::size_t i = 0; i + 3 < ranks.size(); ++i) {
            if (ranks[i + 3] - ranks[i] <= 4) {
                strength += 0.06;
                break;
            }
        }
    }

    return clamp_unit(strength);
}

AiPlayer::AiPlayer()
    : AiPlayer(static_cast<uint64_t>(std::random_device{}())) {}

AiPlayer::AiPlayer(uint64_t seed)
    : uniform_(make_source(seed)) {}

AiPlayer::AiPlayer(UniformSource uniform)
    : uniform_(std::move(uniform)) {}

double AiPlayer::estimate_strength(const poker::TableSnapshot& snapshot, int seat) {
    const auto& player = snapshot.seats(seat);
    auto hole = to_cards(player.hole_cards());
    auto community = to_cards(snapshot.community_cards());

    double strength;
    if (snapshot.phase() == poker::PREFLOP || community.size() < 3 || hole.size() < 2) {
        strength = hole.size() >= 2 ? preflop_strength(hole[0], hole[1]) : 0.0;
    } else {
        strength = postflop_strength(hole, community);
    }

    strength += (uniform_() - 0.5) * kPerturbation;

    const int seats = snapshot.seats_size();
    const int position = (seat - snapshot.dealer_index() + seats) % seats;
    strength += static_cast<double>(position) / seats * kPositionBonus;

    return clamp_unit(strength);
}

std::optional<poker::PlayerAction> AiPlayer::decide(const poker::TableSnapshot& snapshot, int seat) {
    if (seat < 0 || seat >= snapshot.seats_size() || snapshot.valid_actions().empty()) {
        return std::nullopt;
    }

    const double strength = estimate_strength(snapshot, seat);
    const int64_t to_call = snapshot.call_amount();
    const int64_t pot = snapshot.pot();
    const int64_t chips = snapshot.seats(seat).chips();
    const bool can_raise = has_action(snapshot, poker::RAISE);

    poker::PlayerAction action;
    action.set_seat(seat);

    if (to_call == 0 && has_action(snapshot, poker::CHECK)) {
        if (strength > 0.65 && can_raise) {
            return make_raise(snapshot, seat, strength);
        }
        if (uniform_() < 0.12 && can_raise) {
            return make_raise(snapshot, seat, 0.4);
        }
        action.set_action(poker::CHECK);
        return action;
    }

    const double pot_odds = static_cast<double>(to_call) / static_cast<double>(pot + to_call);
    const bool can_call = has_action(snapshot, poker::CALL);

    if (strength > 0.8 && can_raise && chips > to_call) {
        return make_raise(snapshot, seat, strength);
    }

    if ((strength > pot_odds + 0.05 || strength > 0.45) && can_call) {
        if (strength > 0.7 && uniform_() < 0.3 && can_raise) {
            return make_raise(snapshot, seat, strength);
        }
        action.set_action(poker::CALL);
        return action;
    }

    if (uniform_() < 0.08 && can_raise && static_cast<double>(to_call) < pot * 0.3) {
        return make_raise(snapshot, seat, 0.5);
    }

    if (strength > 0.3 && to_call <= snapshot.big_blind() * 3 && can_call) {
        action.set_action(poker::CALL);
        return action;
    }

    action.set_action(poker::FOLD);
    return action;
}

poker::PlayerAction AiPlayer::make_raise(const poker::TableSnapshot& snapshot, int seat, double strength) {
    const auto& player = snapshot.seats(seat);
    const int64_t pot = snapshot.pot();
    const int64_t max_bet = snapshot.current_max_bet();
    const int64_t all_in_total = player.bet() + player.chips();

    int64_t total;
    if (strength > 0.9 || uniform_() < 0.08) {
        total = all_in_total;
    } else if (strength > 0.75) {
        total = max_bet + pot;
    } else if (strength > 0.6) {
        total = max_bet + pot / 2;
    } else {
        total = max_bet + snapshot.min_raise();
    }

    total = std::max(total, max_bet + snapshot.min_raise());
    total = std::min(total, all_in_total);

    poker::PlayerAction action;
    action.set_seat(seat);
    action.set_action(poker::RAISE);
    action.set_amount(total);
    return action;
}

} // namespace ai
