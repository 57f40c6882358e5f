#include "holdem/hand_evaluator.hpp"
#include <algorithm>
#include <array>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace holdem {

namespace {

struct RankGroup {
    int rank;
    int count;
};

// Groups of equal rank, largest group first, higher rank first within a size.
std::vector<RankGroup> group_ranks(const std::vector<int>& ranks_desc) {
    std::array<int, kHighestRank + 1> rank_count{};
    for (int r : ranks_desc) {
        rank_count[r]++;
    }
    std::vector<RankGroup> groups;
    for (int r = kHighestRank; r >= kLowestRank; --r) {
        if (rank_count[r] > 0) {
            groups.push_back({r, rank_count[r]});
        }
    }
    std::stable_sort(groups.begin(), groups.end(), [](const RankGroup& a, const RankGroup& b) {
        return a.count > b.count;
    });
    return groups;
}

std::vector<int> kickers(const std::vector<RankGroup>& groups) {
    std::vector<int> result;
    for (const auto& g : groups) {
        if (g.count == 1) {
            result.push_back(g.rank);
        }
    }
    return result;
}

HandValue make_value(poker::HandCategory category, std::vector<int> tie_break,
                     const std::vector<Card>& cards) {
    HandValue value;
    value.category = category;
    value.tie_break = std::move(tie_break);
    value.best = cards;
    return value;
}

} // anonymous namespace

HandValue evaluate_five(const std::vector<Card>& cards) {
    if (cards.size() != 5) {
        throw std::invalid_argument("evaluate_five needs exactly 5 cards, got " +
                                    std::to_string(cards.size()));
    }

    std::vector<int> ranks;
    ranks.reserve(5);
    for (const auto& c : cards) {
        ranks.push_back(c.rank);
    }
    std::sort(ranks.begin(), ranks.end(), std::greater<int>());

    const bool is_flush = std::all_of(cards.begin(), cards.end(), [&](const Card& c) {
        return c.suit == cards[0].suit;
    });

    std::vector<int> unique_ranks = ranks;
    unique_ranks.erase(std::unique(unique_ranks.begin(), unique_ranks.end()), unique_ranks.end());

    bool is_straight = false;
    int straight_high = 0;
    if (unique_ranks.size() == 5) {
        if (unique_ranks.front() - unique_ranks.back() == 4) {
            is_straight = true;
            straight_high = unique_ranks.front();
        } else if (unique_ranks == std::vector<int>{14, 5, 4, 3, 2}) {
            // The wheel plays as a five-high straight.
            is_straight = true;
            straight_high = 5;
        }
    }

    const auto groups = group_ranks(ranks);

    if (is_straight && is_flush) {
        if (straight_high == kHighestRank) {
            return make_value(poker::ROYAL_FLUSH, {straight_high}, cards);
        }
        return make_value(poker::STRAIGHT_FLUSH, {straight_high}, cards);
    }
    if (groups[0].count == 4) {
        return make_value(poker::FOUR_OF_A_KIND, {groups[0].rank, groups[1].rank}, cards);
    }
    if (groups[0].count == 3 && groups[1].count == 2) {
        return make_value(poker::FULL_HOUSE, {groups[0].rank, groups[1].rank}, cards);
    }
    if (is_flush) {
        return make_value(poker::FLUSH, ranks, cards);
    }
    if (is_straight) {
        return make_value(poker::STRAIGHT, {straight_high}, cards);
    }
    if (groups[0].count == 3) {
        std::vector<int> tie_break = {groups[0].rank};
        for (int k : kickers(groups)) {
            tie_break.push_back(k);
        }
        return make_value(poker::THREE_OF_A_KIND, tie_break, cards);
    }
    if (groups[0].count == 2 && groups[1].count == 2) {
        // groups are already ordered high pair, low pair, kicker
        return make_value(poker::TWO_PAIR, {groups[0].rank, groups[1].rank, groups[2].rank}, cards);
    }
    if (groups[0].count == 2) {
        std::vector<int> tie_break = {groups[0].rank};
        for (int k : kickers(groups)) {
            tie_break.push_back(k);
        }
        return make_value(poker::PAIR, tie_break, cards);
    }
    return make_value(poker::HIGH_CARD, ranks, cards);
}

HandValue evaluate_hand(const std::vector<Card>& cards) {
    const std::size_t n = cards.size();
    if (n < 5) {
        throw std::invalid_argument("evaluate_hand needs at least 5 cards, got " +
                                    std::to_string(n));
    }

    HandValue best;
    bool have_best = false;

    std::array<std::size_t, 5> idx = {0, 1, 2, 3, 4};
    std::vector<Card> combo(5);
    while (true) {
        for (std::size_t i = 0; i < 5; ++i) {
            combo[i] = cards[idx[i]];
        }
        HandValue value = evaluate_five(combo);
        if (!have_best || compare_hands(value, best) > 0) {
            best = std::move(value);
            have_best = true;
        }

        // Advance to the next combination in lexicographic order.
        int i = 4;
        while (i >= 0 && idx[i] == n - 5 + static_cast<std::size_t>(i)) {
            --i;
        }
        if (i < 0) {
            break;
        }
        ++idx[i];
        for (std::size_t j = static_cast<std::size_t>(i) + 1; j < 5; ++j) {
            idx[j] = idx[j - 1] + 1;
        }
    }
    return best;
}

int compare_hands(const HandValue& a, const HandValue& b) {
    if (a.category != b.category) {
        return a.category < b.category ? -1 : 1;
    }
    const std::size_t len = std::min(a.tie_break.size(), b.tie_break.size());
    for (std::size_t i = 0; i < len; ++i) {
        if (a.tie_break[i] != b.tie_break[i]) {
            return a.tie_break[i] < b.tie_break[i] ? -1 : 1;
        }
    }
    return 0;
}

const char* hand_name(poker::HandCategory category) {
    switch (category) {
        case poker::HIGH_CARD: return "High Card";
        case poker::PAIR: return "Pair";
        case poker::TWO_PAIR: return "Two Pair";
        case poker::THREE_OF_A_KIND: return "Three of a Kind";
        case poker::STRAIGHT: return "Straight";
        case poker::FLUSH: return "Flush";
        case poker::FULL_HOUSE: return "Full House";
        case poker::FOUR_OF_A_KIND: return "Four of a Kind";
        case poker::STRAIGHT_FLUSH: return "Straight Flush";
        case poker::ROYAL_FLUSH: return "Royal Flush";
        default: return "Unknown";
    }
}

poker::HandResult to_proto(const HandValue& value) {
    poker::HandResult result;
    result.set_category(value.category);
    for (int r : value.tie_break) {
        result.add_tie_break(r);
    }
    for (const auto& card : value.best) {
        *result.add_best_cards() = to_proto(card);
    }
    return result;
}

HandValue from_proto(const poker::HandResult& result) {
    HandValue value;
    value.category = result.category();
    for (int r : result.tie_break()) {
        value.tie_break.push_back(r);
    }
    for (const auto& card : result.best_cards()) {
        value.best.push_back(from_proto(card));
    }
    return value;
}

}  // namespace holdem
