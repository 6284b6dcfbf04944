#ifndef HOLDEM_BOARD_TEXTURE_HPP
#define HOLDEM_BOARD_TEXTURE_HPP

#include "core/cards.hpp"
#include <vector>

namespace holdem_eval {

// Texture des cartes communes (vide tant que le flop n'est pas posé)
struct BoardTexture {
    bool flush_possible    = false; // 3+ cartes d'une même couleur
    bool pair_on_board     = false;
    bool coordinated       = false; // deux rangs distincts à 2 d'écart ou moins
    bool straight_possible = false; // 3 rangs distincts dans une fenêtre de 5
    int  high_card         = 0;
};

// Potentiel de tirage des cartes privées face au board
struct DrawPotential {
    int  overcards     = 0;
    bool flush_draw    = false;
    bool straight_draw = false;

    bool live() const { return overcards > 0 || flush_draw || straight_draw; }
};

BoardTexture analyze_board(const std::vector<Card>& board);

/**
 * @brief Tirages des cartes privées.
 * @param flush_draw_cards Cartes (privées + board) de la couleur d'une carte privée pour un tirage couleur.
 * @param straight_draw_ranks Rangs distincts (privées + board) requis dans une fenêtre de 5 rangs.
 * @return Potentiel vide si hole_cards n'a pas 2 cartes ou si le board a moins de 3 cartes.
 */
DrawPotential analyze_draws(const std::vector<Card>& hole_cards,
                            const std::vector<Card>& board,
                            int flush_draw_cards = 3,
                            int straight_draw_ranks = 3);

} // namespace holdem_eval

#endif // HOLDEM_BOARD_TEXTURE_HPP
