#ifndef HOLDEM_BITBOARD_HPP
#define HOLDEM_BITBOARD_HPP

#include <bit>
#include <cstdint>
#include <vector>

// Inclure cards.hpp pour les types Card, Rank, Suit
#include "core/cards.hpp"

namespace holdem_eval {

// Type pour les bitboards (masques de bits pour les cartes)
using Bitboard = uint64_t;
// Masque de rangs : bit v pour la valeur v (2..14), bit 1 = As bas
using RankMask = uint16_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr int NUM_CARDS = 52;
constexpr Bitboard FULL_DECK = (1ULL << 52) - 1;

inline void set_card(Bitboard& board, Card c) {
    if (is_valid_card(c)) {
        board |= (1ULL << c);
    }
}

inline void clear_card(Bitboard& board, Card c) {
    if (is_valid_card(c)) {
        board &= ~(1ULL << c);
    }
}

inline bool test_card(Bitboard board, Card c) {
    if (!is_valid_card(c)) return false;
    return (board & (1ULL << c)) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

inline int count_set_bits(RankMask mask) {
    return std::popcount(mask);
}

constexpr RankMask rank_bit(int value) {
    return static_cast<RankMask>(1u << value);
}

/**
 * @brief Ajoute le rang de la carte au masque ; l'As pose aussi le bit 1 (roue).
 */
inline void add_rank(RankMask& mask, Card c) {
    const int v = rank_value(c);
    mask |= rank_bit(v);
    if (v == MAX_RANK_VALUE) mask |= rank_bit(1);
}

/**
 * @brief Plus haute carte d'une suite de 5 rangs consécutifs dans le masque.
 * @return 14..5, ou 0 s'il n'y a pas de suite. La roue A-2-3-4-5 vaut 5.
 */
inline int straight_high(RankMask mask) {
    for (int high = MAX_RANK_VALUE; high >= 5; --high) {
        const RankMask window = static_cast<RankMask>(0x1F << (high - 4));
        if ((mask & window) == window) return high;
    }
    return 0;
}

/**
 * @brief Construit le bitboard d'un ensemble de cartes.
 * @return false si une carte est invalide ou présente deux fois.
 */
inline bool cards_to_board(const std::vector<Card>& cards, Bitboard& out) {
    Bitboard mask = EMPTY_BOARD;
    for (Card c : cards) {
        if (!is_valid_card(c) || test_card(mask, c)) return false;
        set_card(mask, c);
    }
    out = mask;
    return true;
}

} // namespace holdem_eval

#endif // HOLDEM_BITBOARD_HPP
