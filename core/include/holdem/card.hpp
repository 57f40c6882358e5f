#pragma once

#include <string>
#include <vector>
#include "poker/poker_types.pb.h"

namespace holdem {

constexpr int kLowestRank = 2;
constexpr int kHighestRank = 14;  // ace

struct Card {
    poker::Suit suit = poker::SUIT_UNSPECIFIED;
    int rank = 0;

    bool operator==(const Card& other) const {
        return suit == other.suit && rank == other.rank;
    }

    bool operator!=(const Card& other) const {
        return !(*this == other);
    }
};

/// All four suits in deck order.
const std::vector<poker::Suit>& all_suits();

char rank_char(int rank);
char suit_char(poker::Suit suit);

/// Two-character form, e.g. "As", "Td", "2c".
std::string to_string(const Card& card);
std::string to_string(const std::vector<Card>& cards);

/// Parses "As" / "td" / "10h". Throws std::invalid_argument.
Card parse_card(const std::string& text);

/// Parses whitespace separated cards, e.g. "As Ks Qs Js Ts".
std::vector<Card> parse_cards(const std::string& text);

poker::Card to_proto(const Card& card);
Card from_proto(const poker::Card& card);

}  // namespace holdem
