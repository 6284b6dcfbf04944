#ifndef HOLDEM_GAME_UTILS_HPP
#define HOLDEM_GAME_UTILS_HPP

#include "holdem/common_types.h"
#include "core/cards.hpp" // Pour Card et to_string(Card)
#include <string>
#include <vector>

namespace holdem_eval {

std::string street_to_string(Street s);

// 0 -> PREFLOP, 3 -> FLOP, 4 -> TURN, 5 -> RIVER ; 1-2 cartes restent PREFLOP
Street street_from_board_size(std::size_t community_cards);

// "[As Kd Qc]", "--" pour une carte invalide
std::string vec_to_string(const std::vector<Card>& cards);

// "[As Kd] | [Qh Jh Th]"
std::string hand_to_string(const std::vector<Card>& hole_cards, const std::vector<Card>& board);

} // namespace holdem_eval

#endif // HOLDEM_GAME_UTILS_HPP
