#ifndef HOLDEM_HAND_EVALUATOR_HPP
#define HOLDEM_HAND_EVALUATOR_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"

namespace holdem_eval {

// Catégories de mains, de la plus faible à la plus forte.
// La valeur numérique sert directement à la comparaison.
enum class HandCategory : uint8_t {
    HIGH_CARD       = 1,
    ONE_PAIR        = 2,
    TWO_PAIR        = 3,
    THREE_OF_A_KIND = 4,
    STRAIGHT        = 5,
    FLUSH           = 6,
    FULL_HOUSE      = 7,
    FOUR_OF_A_KIND  = 8,
    STRAIGHT_FLUSH  = 9,
    ROYAL_FLUSH     = 10
};

constexpr int category_rank(HandCategory c) {
    return static_cast<int>(c);
}

std::string category_to_string(HandCategory c);

/**
 * @brief Résultat d'évaluation : catégorie + clé de départage.
 *
 * primary_value : rang du carré / brelan / paire (la plus haute pour deux
 * paires), ou carte haute d'une suite / couleur (5 pour la roue).
 * secondary_value : paire basse (deux paires), paire du full, sinon 0.
 * kickers : cartes restantes, ordre décroissant.
 */
struct HandResult {
    HandCategory      category = HandCategory::HIGH_CARD;
    int               primary_value = 0;
    int               secondary_value = 0;
    std::vector<int>  kickers;
    std::string       description;
    std::vector<Card> cards_used;
};

// Descriptions des résultats dégradés
inline const std::string INVALID_HOLE_CARDS_DESCRIPTION = "Invalid hole cards";
inline const std::string INVALID_CARD_SET_DESCRIPTION   = "Invalid card set";

/**
 * @brief Compare deux résultats selon (catégorie, primary, secondary, kickers).
 * @return <0 si a est plus faible, 0 si égalité, >0 si a est plus fort.
 */
int compare_hands(const HandResult& a, const HandResult& b);

inline bool operator<(const HandResult& a, const HandResult& b) {
    return compare_hands(a, b) < 0;
}

// Égalité de force uniquement (la description et les cartes ne comptent pas)
inline bool same_strength(const HandResult& a, const HandResult& b) {
    return compare_hands(a, b) == 0;
}

/**
 * @brief Évalue exactement 5 cartes distinctes.
 */
HandResult evaluate_five(const std::array<Card, 5>& cards);

/**
 * @brief Meilleure main de 5 cartes parmi 2 à 7 cartes distinctes.
 *
 * 5 à 7 cartes : recherche exhaustive sur les C(n,5) sous-ensembles.
 * 3 ou 4 cartes : évaluation partielle (paires, brelan, carré, hauteur).
 * 2 cartes : descripteur de main de départ ("Pocket As", "Suited KQ"...).
 * 0 ou 1 carte : résultat sentinelle "Invalid hole cards".
 * Doublons, cartes invalides ou plus de 7 cartes : sentinelle "Invalid card set".
 * Ne lève jamais d'exception ; le résultat ne dépend pas de l'ordre des cartes.
 */
HandResult evaluate_hand(const std::vector<Card>& cards);

/**
 * @brief Variante trous + board.
 *
 * Sans exactement 2 cartes privées le résultat est la sentinelle
 * "Invalid hole cards". Avec moins de 5 cartes au total, seule la main de
 * départ est décrite.
 */
HandResult evaluate_hand(const std::vector<Card>& hole_cards,
                         const std::vector<Card>& board);

HandResult starting_hand_descriptor(Card c1, Card c2);
HandResult invalid_hand_result(const std::string& description);

bool is_invalid_result(const HandResult& result);

// Trie les cartes par rang décroissant (puis par index), forme canonique.
void sort_cards_desc(std::vector<Card>& cards);

std::string hand_result_to_string(const HandResult& result);

} // namespace holdem_eval

#endif // HOLDEM_HAND_EVALUATOR_HPP
