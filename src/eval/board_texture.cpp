#include "eval/board_texture.hpp"
#include "core/bitboard.hpp"

#include <algorithm>
#include <array>

namespace holdem_eval {

namespace {

constexpr size_t MIN_BOARD_CARDS = 3;

// Fenêtre de 5 rangs consécutifs se terminant à high (high = 5 : roue)
constexpr RankMask straight_window(int high) {
    return static_cast<RankMask>(0x1F << (high - 4));
}

} // namespace

BoardTexture analyze_board(const std::vector<Card>& board) {
    BoardTexture texture;
    if (board.size() < MIN_BOARD_CARDS) {
        return texture;
    }

    std::array<int, 4> suit_counts{};
    std::array<int, MAX_RANK_VALUE + 1> rank_counts{};
    RankMask ranks = 0;
    for (Card c : board) {
        ++suit_counts[static_cast<size_t>(get_suit(c))];
        ++rank_counts[rank_value(c)];
        add_rank(ranks, c);
        texture.high_card = std::max(texture.high_card, rank_value(c));
    }

    texture.flush_possible = *std::max_element(suit_counts.begin(), suit_counts.end()) >= 3;
    texture.pair_on_board = *std::max_element(rank_counts.begin(), rank_counts.end()) >= 2;

    int previous = 0;
    for (int r = MIN_RANK_VALUE; r <= MAX_RANK_VALUE; ++r) {
        if (rank_counts[r] == 0) continue;
        if (previous != 0 && r - previous <= 2) texture.coordinated = true;
        previous = r;
    }

    for (int high = MAX_RANK_VALUE; high >= 5; --high) {
        if (count_set_bits(static_cast<RankMask>(ranks & straight_window(high))) >= 3) {
            texture.straight_possible = true;
            break;
        }
    }
    return texture;
}

DrawPotential analyze_draws(const std::vector<Card>& hole_cards,
                            const std::vector<Card>& board,
                            int flush_draw_cards,
                            int straight_draw_ranks) {
    DrawPotential draws;
    if (hole_cards.size() != 2 || board.size() < MIN_BOARD_CARDS) {
        return draws;
    }

    int board_high = 0;
    std::array<int, 4> suit_counts{};
    RankMask all_ranks = 0;
    for (Card c : board) {
        board_high = std::max(board_high, rank_value(c));
        ++suit_counts[static_cast<size_t>(get_suit(c))];
        add_rank(all_ranks, c);
    }

    for (Card c : hole_cards) {
        if (rank_value(c) > board_high) ++draws.overcards;
        ++suit_counts[static_cast<size_t>(get_suit(c))];
        add_rank(all_ranks, c);
    }

    for (Card c : hole_cards) {
        if (suit_counts[static_cast<size_t>(get_suit(c))] >= flush_draw_cards) {
            draws.flush_draw = true;
        }
    }

    // Rangs distincts de toute la main (privées + board), As bas compris
    for (int high = MAX_RANK_VALUE; high >= 5; --high) {
        if (count_set_bits(static_cast<RankMask>(all_ranks & straight_window(high))) >= straight_draw_ranks) {
            draws.straight_draw = true;
            break;
        }
    }
    return draws;
}

} // namespace holdem_eval
