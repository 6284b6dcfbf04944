#ifndef HOLDEM_CARDS_HPP
#define HOLDEM_CARDS_HPP

#include <cstdint>
#include <string>
#include <stdexcept> // Pour std::invalid_argument

namespace holdem_eval {

// Une carte = index compact 0-51 (suit * 13 + rank)
using Card = uint8_t;

// Constante pour une carte invalide/inconnue
constexpr Card INVALID_CARD = 52;

// Enum pour les couleurs (suits). Aucun ordre entre couleurs n'est utilisé.
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };
// Enum pour les rangs (ranks)
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

// Valeurs numériques des rangs (As = 14)
constexpr int MIN_RANK_VALUE = 2;
constexpr int MAX_RANK_VALUE = 14;
constexpr int BROADWAY_MIN_VALUE = 10;

/**
 * @brief Levée quand un rang ou une couleur ne fait pas partie du jeu standard.
 */
class InvalidCardError : public std::invalid_argument {
public:
    explicit InvalidCardError(const std::string& what_arg)
        : std::invalid_argument(what_arg) {}
};

// Format: index 0-51 = suit * 13 + rank
constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(s) * 13 + static_cast<uint8_t>(r);
}

constexpr Rank get_rank(Card c) {
    return static_cast<Rank>(c % 13);
}

constexpr Suit get_suit(Card c) {
    return static_cast<Suit>(c / 13);
}

constexpr bool is_valid_card(Card c) {
    return c < INVALID_CARD;
}

// 2..14
constexpr int rank_value(Card c) {
    return static_cast<int>(get_rank(c)) + MIN_RANK_VALUE;
}

constexpr bool is_broadway(Card c) {
    return rank_value(c) >= BROADWAY_MIN_VALUE;
}

/**
 * @brief Construit une carte depuis l'encodage des payloads de jeu.
 * @param rank "2".."10", "J", "Q", "K", "A".
 * @param suit "spades", "hearts", "diamonds", "clubs".
 * @throws InvalidCardError si le rang ou la couleur est inconnu.
 */
Card parse_card(const std::string& rank, const std::string& suit);

// Fonctions de conversion string <-> Card/Rank/Suit (notation courte "As", "Td")
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

// Jetons de l'encodage entrant ("10", "J"... / "spades"...)
std::string rank_label(int value);
std::string rank_label(Card c);
std::string suit_name(Card c);
int rank_value_from_label(const std::string& rank);

} // namespace holdem_eval

#endif // HOLDEM_CARDS_HPP
