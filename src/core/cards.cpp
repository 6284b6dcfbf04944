#include "core/cards.hpp"
#include <cctype>
#include <map>

namespace holdem_eval {

namespace {

const std::map<char, Rank> CHAR_TO_RANK = {
    {'2', Rank::TWO}, {'3', Rank::THREE}, {'4', Rank::FOUR}, {'5', Rank::FIVE},
    {'6', Rank::SIX}, {'7', Rank::SEVEN}, {'8', Rank::EIGHT}, {'9', Rank::NINE},
    {'T', Rank::TEN}, {'J', Rank::JACK}, {'Q', Rank::QUEEN}, {'K', Rank::KING},
    {'A', Rank::ACE}
};
const std::map<char, Suit> CHAR_TO_SUIT = {
    {'c', Suit::CLUBS}, {'d', Suit::DIAMONDS}, {'h', Suit::HEARTS}, {'s', Suit::SPADES}
};
const std::map<Suit, char> SUIT_TO_CHAR = {
    {Suit::CLUBS, 'c'}, {Suit::DIAMONDS, 'd'}, {Suit::HEARTS, 'h'}, {Suit::SPADES, 's'}
};

// Encodage entrant : les rangs sont des chaînes, "10" pour le dix
const std::map<std::string, int> LABEL_TO_VALUE = {
    {"2", 2}, {"3", 3}, {"4", 4}, {"5", 5}, {"6", 6}, {"7", 7}, {"8", 8},
    {"9", 9}, {"10", 10}, {"J", 11}, {"Q", 12}, {"K", 13}, {"A", 14}
};
const std::map<std::string, Suit> NAME_TO_SUIT = {
    {"clubs", Suit::CLUBS}, {"diamonds", Suit::DIAMONDS},
    {"hearts", Suit::HEARTS}, {"spades", Suit::SPADES}
};

} // namespace

Card parse_card(const std::string& rank, const std::string& suit) {
    const int value = rank_value_from_label(rank);
    auto it = NAME_TO_SUIT.find(suit);
    if (it == NAME_TO_SUIT.end()) {
        throw InvalidCardError("Invalid suit: '" + suit + "'");
    }
    return make_card(static_cast<Rank>(value - MIN_RANK_VALUE), it->second);
}

int rank_value_from_label(const std::string& rank) {
    auto it = LABEL_TO_VALUE.find(rank);
    if (it == LABEL_TO_VALUE.end()) {
        throw InvalidCardError("Invalid rank: '" + rank + "'");
    }
    return it->second;
}

Rank rank_from_char(char r) {
    auto it = CHAR_TO_RANK.find(static_cast<char>(std::toupper(static_cast<unsigned char>(r))));
    if (it == CHAR_TO_RANK.end()) {
        throw InvalidCardError("Invalid rank character: " + std::string(1, r));
    }
    return it->second;
}

Suit suit_from_char(char s) {
    auto it = CHAR_TO_SUIT.find(static_cast<char>(std::tolower(static_cast<unsigned char>(s))));
    if (it == CHAR_TO_SUIT.end()) {
        throw InvalidCardError("Invalid suit character: " + std::string(1, s));
    }
    return it->second;
}

std::string to_string(Rank r) {
    static const char RANK_CHARS[] = "23456789TJQKA";
    const auto idx = static_cast<uint8_t>(r);
    if (idx > static_cast<uint8_t>(Rank::ACE)) return "?";
    return std::string(1, RANK_CHARS[idx]);
}

std::string to_string(Suit s) {
    auto it = SUIT_TO_CHAR.find(s);
    if (it == SUIT_TO_CHAR.end()) {
        return "?";
    }
    return std::string(1, it->second);
}

std::string to_string(Card c) {
    if (!is_valid_card(c)) return "??";
    return to_string(get_rank(c)) + to_string(get_suit(c));
}

Card card_from_string(const std::string& s) {
    // "As", "Td" ou "10d"
    std::string rank_part;
    char suit_char = '\0';
    if (s.length() == 2) {
        rank_part = s.substr(0, 1);
        suit_char = s[1];
    } else if (s.length() == 3 && s.compare(0, 2, "10") == 0) {
        rank_part = "T";
        suit_char = s[2];
    } else {
        throw InvalidCardError("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        Rank r = rank_from_char(rank_part[0]);
        Suit su = suit_from_char(suit_char);
        return make_card(r, su);
    } catch (const InvalidCardError& e) {
        // Propage l'erreur avec plus de contexte
        throw InvalidCardError("Invalid card string '" + s + "': " + e.what());
    }
}

std::string rank_label(int value) {
    switch (value) {
        case 14: return "A";
        case 13: return "K";
        case 12: return "Q";
        case 11: return "J";
        default: break;
    }
    if (value < MIN_RANK_VALUE || value > MAX_RANK_VALUE) return "?";
    return std::to_string(value);
}

std::string rank_label(Card c) {
    return rank_label(rank_value(c));
}

std::string suit_name(Card c) {
    switch (get_suit(c)) {
        case Suit::CLUBS:    return "clubs";
        case Suit::DIAMONDS: return "diamonds";
        case Suit::HEARTS:   return "hearts";
        case Suit::SPADES:   return "spades";
    }
    return "?";
}

} // namespace holdem_eval
