#include <catch2/catch_test_macros.hpp>
#include "eval/hand_evaluator.hpp"
#include "core/cards.hpp"
#include "core/deck.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <vector>

using namespace holdem_eval;

namespace {

std::vector<Card> H(std::initializer_list<const char*> cards) {
    std::vector<Card> out;
    for (const char* s : cards) out.push_back(card_from_string(s));
    return out;
}

std::array<Card, 5> F(const char* a, const char* b, const char* c, const char* d, const char* e) {
    return {card_from_string(a), card_from_string(b), card_from_string(c),
            card_from_string(d), card_from_string(e)};
}

} // namespace

TEST_CASE("Canonical five card hands", "[evaluator]") {
    SECTION("Royal flush") {
        HandResult r = evaluate_five(F("As", "Ks", "Qs", "Js", "Ts"));
        REQUIRE(r.category == HandCategory::ROYAL_FLUSH);
        REQUIRE(r.primary_value == 14);
        REQUIRE(r.kickers.empty());
        REQUIRE(r.description == "Royal Flush");
    }

    SECTION("Straight flush") {
        HandResult r = evaluate_five(F("9h", "8h", "7h", "6h", "5h"));
        REQUIRE(r.category == HandCategory::STRAIGHT_FLUSH);
        REQUIRE(r.primary_value == 9);
    }

    SECTION("Steel wheel is a five-high straight flush, not royal") {
        HandResult r = evaluate_five(F("Ad", "2d", "3d", "4d", "5d"));
        REQUIRE(r.category == HandCategory::STRAIGHT_FLUSH);
        REQUIRE(r.primary_value == 5);
    }

    SECTION("Four of a kind") {
        HandResult r = evaluate_five(F("As", "Ah", "Ac", "Ad", "Ks"));
        REQUIRE(r.category == HandCategory::FOUR_OF_A_KIND);
        REQUIRE(r.primary_value == 14);
        REQUIRE(r.kickers == std::vector<int>{13});
    }

    SECTION("Full house") {
        HandResult r = evaluate_five(F("3s", "3h", "3c", "Kd", "Ks"));
        REQUIRE(r.category == HandCategory::FULL_HOUSE);
        REQUIRE(r.primary_value == 3);
        REQUIRE(r.secondary_value == 13);
    }

    SECTION("Flush") {
        HandResult r = evaluate_five(F("Kc", "9c", "7c", "4c", "2c"));
        REQUIRE(r.category == HandCategory::FLUSH);
        REQUIRE(r.primary_value == 13);
        REQUIRE(r.kickers == std::vector<int>{9, 7, 4, 2});
    }

    SECTION("Wheel straight") {
        HandResult r = evaluate_five(F("As", "2h", "3c", "4d", "5s"));
        REQUIRE(r.category == HandCategory::STRAIGHT);
        REQUIRE(r.primary_value == 5);
        REQUIRE(r.kickers.empty());
    }

    SECTION("Three of a kind") {
        HandResult r = evaluate_five(F("7s", "7h", "7c", "Ad", "2s"));
        REQUIRE(r.category == HandCategory::THREE_OF_A_KIND);
        REQUIRE(r.primary_value == 7);
        REQUIRE(r.kickers == std::vector<int>{14, 2});
    }

    SECTION("Two pair") {
        HandResult r = evaluate_five(F("Js", "Jh", "4c", "4d", "9s"));
        REQUIRE(r.category == HandCategory::TWO_PAIR);
        REQUIRE(r.primary_value == 11);
        REQUIRE(r.secondary_value == 4);
        REQUIRE(r.kickers == std::vector<int>{9});
    }

    SECTION("One pair") {
        HandResult r = evaluate_five(F("Ts", "Th", "Ac", "8d", "3s"));
        REQUIRE(r.category == HandCategory::ONE_PAIR);
        REQUIRE(r.primary_value == 10);
        REQUIRE(r.kickers == std::vector<int>{14, 8, 3});
    }

    SECTION("High card") {
        HandResult r = evaluate_five(F("Ks", "Jh", "8c", "5d", "2s"));
        REQUIRE(r.category == HandCategory::HIGH_CARD);
        REQUIRE(r.primary_value == 13);
        REQUIRE(r.kickers == std::vector<int>{11, 8, 5, 2});
    }
}

TEST_CASE("Starting hand descriptors", "[evaluator][preflop]") {
    SECTION("Pocket aces") {
        HandResult r = evaluate_hand(H({"As", "Ah"}), {});
        REQUIRE(r.description == "Pocket As");
        REQUIRE(r.category == HandCategory::HIGH_CARD);
        REQUIRE(r.primary_value == 14);
    }

    SECTION("Suited king-queen, high card first") {
        REQUIRE(evaluate_hand(H({"Ks", "Qs"}), {}).description == "Suited KQ");
        REQUIRE(evaluate_hand(H({"Qs", "Ks"}), {}).description == "Suited KQ");
    }

    SECTION("Offsuit and the ten label") {
        REQUIRE(evaluate_hand(H({"Kd", "As"}), {}).description == "Offsuit AK");
        REQUIRE(evaluate_hand(H({"Td", "Th"}), {}).description == "Pocket 10s");
    }

    SECTION("Incomplete board keeps the descriptor") {
        HandResult r = evaluate_hand(H({"As", "Ah"}), H({"2c", "7d"}));
        REQUIRE(r.description == "Pocket As");
    }
}

TEST_CASE("Degraded inputs never throw", "[evaluator][invalid]") {
    SECTION("Wrong hole card count") {
        REQUIRE(evaluate_hand(H({"As"}), H({"Kd", "Qd", "Jd"})).description == INVALID_HOLE_CARDS_DESCRIPTION);
        REQUIRE(evaluate_hand(H({"As", "Kd", "Qd"}), {}).description == INVALID_HOLE_CARDS_DESCRIPTION);
        REQUIRE(evaluate_hand(std::vector<Card>{}).description == INVALID_HOLE_CARDS_DESCRIPTION);
    }

    SECTION("Duplicates and out-of-range cards") {
        HandResult dup = evaluate_hand(H({"As", "Kd"}), H({"As", "2c", "3h"}));
        REQUIRE(dup.description == INVALID_CARD_SET_DESCRIPTION);
        REQUIRE(is_invalid_result(dup));
        REQUIRE(is_invalid_result(evaluate_hand({card_from_string("As"), INVALID_CARD})));
        REQUIRE(is_invalid_result(evaluate_hand(H({"As", "As"}), {})));
    }

    SECTION("More than seven cards") {
        REQUIRE(evaluate_hand(H({"As", "Kd", "Qh", "Jc", "9s", "8d", "7h", "6c"})).description
                == INVALID_CARD_SET_DESCRIPTION);
    }
}

TEST_CASE("Partial evaluation of three and four cards", "[evaluator][partial]") {
    HandResult trips = evaluate_hand(H({"9s", "9h", "9c"}));
    REQUIRE(trips.category == HandCategory::THREE_OF_A_KIND);
    REQUIRE(trips.primary_value == 9);

    HandResult two_pair = evaluate_hand(H({"Qs", "Qh", "3c", "3d"}));
    REQUIRE(two_pair.category == HandCategory::TWO_PAIR);
    REQUIRE(two_pair.primary_value == 12);
    REQUIRE(two_pair.secondary_value == 3);

    // Ni suite ni couleur sous 5 cartes
    REQUIRE(evaluate_hand(H({"Ks", "Qs", "Js", "Ts"})).category == HandCategory::HIGH_CARD);
}

TEST_CASE("Seven card evaluation", "[evaluator]") {
    SECTION("Best five of seven") {
        HandResult r = evaluate_hand(H({"Ah", "Kh"}), H({"Qh", "Jh", "Th", "2c", "2d"}));
        REQUIRE(r.category == HandCategory::ROYAL_FLUSH);
        REQUIRE(r.cards_used.size() == 5);
    }

    SECTION("Two trips make the best full house") {
        HandResult r = evaluate_hand(H({"8s", "8h"}), H({"8c", "Kd", "Ks", "Kh", "2c"}));
        REQUIRE(r.category == HandCategory::FULL_HOUSE);
        REQUIRE(r.primary_value == 13);
        REQUIRE(r.secondary_value == 8);
    }

    SECTION("Three pairs keep the best kicker") {
        HandResult r = evaluate_hand(H({"As", "4h"}), H({"4c", "9d", "9s", "Qh", "Qc"}));
        REQUIRE(r.category == HandCategory::TWO_PAIR);
        REQUIRE(r.primary_value == 12);
        REQUIRE(r.secondary_value == 9);
        REQUIRE(r.kickers == std::vector<int>{14});
    }

    SECTION("Six-high straight beats the wheel") {
        HandResult r = evaluate_hand(H({"As", "6h"}), H({"2c", "3d", "4s", "5h", "Kc"}));
        REQUIRE(r.category == HandCategory::STRAIGHT);
        REQUIRE(r.primary_value == 6);
    }
}

TEST_CASE("Evaluation is order independent", "[evaluator][order]") {
    std::vector<Card> cards = H({"Jd", "Js", "4c", "9h", "Kd", "4s", "2h"});
    HandResult reference = evaluate_hand(cards);

    std::sort(cards.begin(), cards.end());
    do {
        HandResult r = evaluate_hand(cards);
        REQUIRE(same_strength(r, reference));
        REQUIRE(r.description == reference.description);
        REQUIRE(r.cards_used == reference.cards_used);
    } while (std::next_permutation(cards.begin(), cards.end()));
}

TEST_CASE("Seven card result is the maximum over all subsets", "[evaluator][brute_force]") {
    for (uint32_t seed = 1; seed <= 200; ++seed) {
        Deck deck(seed);
        std::vector<Card> seven = deck.deal(7);
        HandResult best = evaluate_hand(seven);
        INFO("seed " << seed << " : " << hand_result_to_string(best));

        bool reached = false;
        for (size_t skip1 = 0; skip1 < 7; ++skip1) {
            for (size_t skip2 = skip1 + 1; skip2 < 7; ++skip2) {
                std::array<Card, 5> subset{};
                size_t k = 0;
                for (size_t i = 0; i < 7; ++i) {
                    if (i != skip1 && i != skip2) subset[k++] = seven[i];
                }
                HandResult candidate = evaluate_five(subset);
                REQUIRE(compare_hands(candidate, best) <= 0);
                reached = reached || same_strength(candidate, best);
            }
        }
        REQUIRE(reached);
    }
}

TEST_CASE("Hand comparison", "[evaluator][compare]") {
    HandResult kings = evaluate_five(F("Ks", "Kh", "9c", "5d", "2s"));
    HandResult kings_better_kicker = evaluate_five(F("Kd", "Kc", "Tc", "5h", "2c"));
    HandResult aces = evaluate_five(F("As", "Ah", "3c", "4d", "6s"));

    REQUIRE(kings < kings_better_kicker);
    REQUIRE(kings_better_kicker < aces);
    REQUIRE(compare_hands(aces, kings) > 0);
    REQUIRE(same_strength(kings, evaluate_five(F("Kd", "Kc", "9h", "5c", "2d"))));
}
