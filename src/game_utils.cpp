#include "holdem/game_utils.hpp"

namespace holdem_eval {

std::string street_to_string(Street s) {
    switch (s) {
        case Street::PREFLOP: return "Preflop";
        case Street::FLOP:    return "Flop";
        case Street::TURN:    return "Turn";
        case Street::RIVER:   return "River";
    }
    return "UnknownStreet";
}

Street street_from_board_size(std::size_t community_cards) {
    switch (community_cards) {
        case 3:  return Street::FLOP;
        case 4:  return Street::TURN;
        case 0:
        case 1:
        case 2:  return Street::PREFLOP;
        default: return Street::RIVER;
    }
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::string out = "[";
    for (Card c : cards) {
        if (out.size() > 1) out += ' ';
        out += is_valid_card(c) ? holdem_eval::to_string(c) : "--";
    }
    out += ']';
    return out;
}

std::string hand_to_string(const std::vector<Card>& hole_cards, const std::vector<Card>& board) {
    if (board.empty()) return vec_to_string(hole_cards);
    return vec_to_string(hole_cards) + " | " + vec_to_string(board);
}

} // namespace holdem_eval
