#include "holdem/card.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace holdem {

namespace {

constexpr const char* kRankChars = "23456789TJQKA";

int parse_rank(const std::string& text) {
    if (text == "10") {
        return 10;
    }
    if (text.size() != 1) {
        throw std::invalid_argument("Invalid rank: " + text);
    }
    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    for (int rank = kLowestRank; rank <= kHighestRank; ++rank) {
        if (kRankChars[rank - kLowestRank] == c) {
            return rank;
        }
    }
    throw std::invalid_argument("Invalid rank: " + text);
}

poker::Suit parse_suit(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'c': return poker::CLUBS;
        case 'd': return poker::DIAMONDS;
        case 'h': return poker::HEARTS;
        case 's': return poker::SPADES;
        default:
            throw std::invalid_argument(std::string("Invalid suit: ") + c);
    }
}

} // anonymous namespace

const std::vector<poker::Suit>& all_suits() {
    static const std::vector<poker::Suit> suits = {
        poker::HEARTS, poker::DIAMONDS,
        poker::CLUBS, poker::SPADES
    };
    return suits;
}

char rank_char(int rank) {
    if (rank < kLowestRank || rank > kHighestRank) {
        return '?';
    }
    return kRankChars[rank - kLowestRank];
}

char suit_char(poker::Suit suit) {
    switch (suit) {
        case poker::CLUBS: return 'c';
        case poker::DIAMONDS: return 'd';
        case poker::HEARTS: return 'h';
        case poker::SPADES: return 's';
        default: return '?';
    }
}

std::string to_string(const Card& card) {
    return std::string{rank_char(card.rank), suit_char(card.suit)};
}

std::string to_string(const std::vector<Card>& cards) {
    std::string out;
    for (const auto& card : cards) {
        if (!out.empty()) {
            out += ' ';
        }
        out += to_string(card);
    }
    return out;
}

Card parse_card(const std::string& text) {
    if (text.size() < 2 || text.size() > 3) {
        throw std::invalid_argument("Invalid card: " + text);
    }
    Card card;
    card.rank = parse_rank(text.substr(0, text.size() - 1));
    card.suit = parse_suit(text.back());
    return card;
}

std::vector<Card> parse_cards(const std::string& text) {
    std::vector<Card> cards;
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        cards.push_back(parse_card(token));
    }
    return cards;
}

poker::Card to_proto(const Card& card) {
    poker::Card proto;
    proto.set_suit(card.suit);
    proto.set_rank(static_cast<poker::Rank>(card.rank));
    return proto;
}

Card from_proto(const poker::Card& card) {
    return Card{card.suit(), static_cast<int>(card.rank())};
}

}  // namespace holdem
