#ifndef HOLDEM_CORE_DECK_HPP
#define HOLDEM_CORE_DECK_HPP

#include "core/cards.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace holdem_eval {

/**
 * @brief Jeu de 52 cartes mélangé par un générateur injectable.
 *
 * Le même seed redonne la même séquence de cartes, ce qui permet aux tests
 * de tirer des mains "aléatoires" reproductibles.
 */
class Deck {
public:
    explicit Deck(uint32_t seed);

    Card deal_card();
    std::vector<Card> deal(size_t count);
    void shuffle();
    void reset();

    // Retire des cartes mortes (déjà distribuées ailleurs) du paquet
    void remove_cards(const std::vector<Card>& dead);

    size_t remaining() const { return cards_.size() - next_card_index_; }

private:
    std::vector<Card> cards_;
    size_t            next_card_index_;
    std::mt19937      rng_;
};

} // namespace holdem_eval

#endif // HOLDEM_CORE_DECK_HPP
