#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "core/bitboard.hpp"
#include "core/cards.hpp"

using namespace holdem_eval;

TEST_CASE("Bitboard Basic Operations", "[bitboard]") {
    Bitboard board = EMPTY_BOARD;
    Card ac = card_from_string("Ac");
    Card kd = card_from_string("Kd");

    SECTION("Set and Test Card") {
        REQUIRE_FALSE(test_card(board, ac));
        set_card(board, ac);
        REQUIRE(test_card(board, ac));
        REQUIRE_FALSE(test_card(board, kd));
        set_card(board, kd);
        REQUIRE(test_card(board, kd));
    }

    SECTION("Clear Card") {
        set_card(board, ac);
        set_card(board, kd);
        clear_card(board, ac);
        REQUIRE_FALSE(test_card(board, ac));
        REQUIRE(test_card(board, kd));
    }

    SECTION("Idempotency of Set Card") {
        set_card(board, ac);
        Bitboard board_copy = board;
        set_card(board, ac);
        REQUIRE(board == board_copy);
        REQUIRE(count_set_bits(board) == 1);
    }

    SECTION("Invalid cards are ignored") {
        set_card(board, INVALID_CARD);
        REQUIRE(board == EMPTY_BOARD);
        REQUIRE_FALSE(test_card(FULL_DECK, INVALID_CARD));
        REQUIRE(count_set_bits(FULL_DECK) == NUM_CARDS);
    }
}

TEST_CASE("Bitboard Conversions", "[bitboard]") {
    Bitboard out = EMPTY_BOARD;

    SECTION("Distinct cards") {
        std::vector<Card> cards = { card_from_string("As"), card_from_string("Kh"), card_from_string("2c") };
        REQUIRE(cards_to_board(cards, out));
        REQUIRE(count_set_bits(out) == 3);
        REQUIRE(test_card(out, card_from_string("Kh")));
    }

    SECTION("Duplicates and invalid cards are rejected") {
        REQUIRE_FALSE(cards_to_board({card_from_string("As"), card_from_string("As")}, out));
        REQUIRE_FALSE(cards_to_board({card_from_string("As"), INVALID_CARD}, out));
        REQUIRE(out == EMPTY_BOARD);
    }

    SECTION("Empty input") {
        REQUIRE(cards_to_board({}, out));
        REQUIRE(out == EMPTY_BOARD);
    }
}

TEST_CASE("Rank masks and straights", "[bitboard][straight]") {
    auto mask_of = [](std::initializer_list<const char*> cards) {
        RankMask mask = 0;
        for (const char* s : cards) add_rank(mask, card_from_string(s));
        return mask;
    };

    SECTION("The ace sets both ends") {
        RankMask mask = mask_of({"As"});
        REQUIRE((mask & rank_bit(14)) != 0);
        REQUIRE((mask & rank_bit(1)) != 0);
        REQUIRE(count_set_bits(mask) == 2);
    }

    SECTION("Broadway and wheel") {
        REQUIRE(straight_high(mask_of({"As", "Ks", "Qd", "Jc", "Th"})) == 14);
        REQUIRE(straight_high(mask_of({"As", "2s", "3d", "4c", "5h"})) == 5);
        REQUIRE(straight_high(mask_of({"6s", "2s", "3d", "4c", "5h", "As"})) == 6);
    }

    SECTION("No straight") {
        REQUIRE(straight_high(mask_of({"As", "Ks", "Qd", "Jc", "9h"})) == 0);
        REQUIRE(straight_high(mask_of({"Ks", "As", "2d", "3c", "4h"})) == 0);
        REQUIRE(straight_high(0) == 0);
    }
}
