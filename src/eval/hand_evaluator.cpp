// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur exact "meilleure main de 5 cartes" par énumération des
//  sous-ensembles (au plus C(7,5) = 21). Pas de tables de lookup : chaque
//  sous-ensemble est classé depuis son histogramme de rangs, son drapeau
//  couleur et son drapeau suite.
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"
#include "core/bitboard.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <sstream>

namespace holdem_eval {

namespace {

struct RankGroup {
    int count;
    int rank;
};

// Groupes triés par cardinalité décroissante puis rang décroissant
std::vector<RankGroup> group_ranks(const Card* cards, size_t n) {
    std::array<int, MAX_RANK_VALUE + 1> counts{};
    for (size_t i = 0; i < n; ++i) {
        ++counts[rank_value(cards[i])];
    }
    std::vector<RankGroup> groups;
    for (int r = MAX_RANK_VALUE; r >= MIN_RANK_VALUE; --r) {
        if (counts[r] > 0) groups.push_back({counts[r], r});
    }
    std::stable_sort(groups.begin(), groups.end(),
                     [](const RankGroup& a, const RankGroup& b) { return a.count > b.count; });
    return groups;
}

void append_kickers(HandResult& result, const std::vector<RankGroup>& groups, size_t from) {
    for (size_t i = from; i < groups.size(); ++i) {
        for (int k = 0; k < groups[i].count; ++k) {
            result.kickers.push_back(groups[i].rank);
        }
    }
}

// Catégories qui ne dépendent que de l'histogramme des rangs
HandResult classify_groups(const std::vector<RankGroup>& groups) {
    HandResult result;
    const int top = groups[0].count;
    result.primary_value = groups[0].rank;

    if (top == 4) {
        result.category = HandCategory::FOUR_OF_A_KIND;
        append_kickers(result, groups, 1);
    } else if (top == 3 && groups.size() > 1 && groups[1].count >= 2) {
        result.category = HandCategory::FULL_HOUSE;
        result.secondary_value = groups[1].rank;
    } else if (top == 3) {
        result.category = HandCategory::THREE_OF_A_KIND;
        append_kickers(result, groups, 1);
    } else if (top == 2 && groups.size() > 1 && groups[1].count == 2) {
        result.category = HandCategory::TWO_PAIR;
        result.secondary_value = groups[1].rank;
        append_kickers(result, groups, 2);
    } else if (top == 2) {
        result.category = HandCategory::ONE_PAIR;
        append_kickers(result, groups, 1);
    } else {
        result.category = HandCategory::HIGH_CARD;
        append_kickers(result, groups, 1);
    }
    return result;
}

// 3 ou 4 cartes : ni suite ni couleur possibles
HandResult evaluate_partial(const std::vector<Card>& sorted_cards) {
    HandResult result = classify_groups(group_ranks(sorted_cards.data(), sorted_cards.size()));
    result.description = category_to_string(result.category);
    result.cards_used = sorted_cards;
    return result;
}

} // namespace

std::string category_to_string(HandCategory c) {
    switch (c) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::ONE_PAIR:        return "One Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
        case HandCategory::ROYAL_FLUSH:     return "Royal Flush";
    }
    return "Unknown";
}

int compare_hands(const HandResult& a, const HandResult& b) {
    if (a.category != b.category) {
        return category_rank(a.category) < category_rank(b.category) ? -1 : 1;
    }
    if (a.primary_value != b.primary_value) {
        return a.primary_value < b.primary_value ? -1 : 1;
    }
    if (a.secondary_value != b.secondary_value) {
        return a.secondary_value < b.secondary_value ? -1 : 1;
    }
    const size_t n = std::min(a.kickers.size(), b.kickers.size());
    for (size_t i = 0; i < n; ++i) {
        if (a.kickers[i] != b.kickers[i]) {
            return a.kickers[i] < b.kickers[i] ? -1 : 1;
        }
    }
    if (a.kickers.size() != b.kickers.size()) {
        return a.kickers.size() < b.kickers.size() ? -1 : 1;
    }
    return 0;
}

void sort_cards_desc(std::vector<Card>& cards) {
    std::sort(cards.begin(), cards.end(), [](Card a, Card b) {
        if (rank_value(a) != rank_value(b)) return rank_value(a) > rank_value(b);
        return a > b;
    });
}

HandResult evaluate_five(const std::array<Card, 5>& cards) {
    std::vector<RankGroup> groups = group_ranks(cards.data(), cards.size());

    RankMask ranks = 0;
    bool flush = true;
    for (Card c : cards) {
        add_rank(ranks, c);
        if (get_suit(c) != get_suit(cards[0])) flush = false;
    }
    // Une suite exige 5 rangs distincts ; la roue vaut 5
    const int straight = groups.size() == 5 ? straight_high(ranks) : 0;

    HandResult result;
    if (flush && straight != 0) {
        result.category = straight == MAX_RANK_VALUE ? HandCategory::ROYAL_FLUSH
                                                     : HandCategory::STRAIGHT_FLUSH;
        result.primary_value = straight;
    } else if (groups[0].count == 4 || (groups[0].count == 3 && groups[1].count == 2)) {
        result = classify_groups(groups);
    } else if (flush) {
        result.category = HandCategory::FLUSH;
        result.primary_value = groups[0].rank;
        append_kickers(result, groups, 1);
    } else if (straight != 0) {
        result.category = HandCategory::STRAIGHT;
        result.primary_value = straight;
    } else {
        result = classify_groups(groups);
    }

    result.description = category_to_string(result.category);
    result.cards_used.assign(cards.begin(), cards.end());
    sort_cards_desc(result.cards_used);
    return result;
}

HandResult invalid_hand_result(const std::string& description) {
    HandResult result;
    result.category = HandCategory::HIGH_CARD;
    result.description = description;
    return result;
}

bool is_invalid_result(const HandResult& result) {
    return result.description == INVALID_HOLE_CARDS_DESCRIPTION ||
           result.description == INVALID_CARD_SET_DESCRIPTION;
}

HandResult starting_hand_descriptor(Card c1, Card c2) {
    Card hi = c1;
    Card lo = c2;
    if (rank_value(c2) > rank_value(c1) || (rank_value(c2) == rank_value(c1) && c2 > c1)) {
        std::swap(hi, lo);
    }

    HandResult result;
    result.category = HandCategory::HIGH_CARD;
    result.primary_value = rank_value(hi);
    result.kickers = {rank_value(lo)};
    result.cards_used = {hi, lo};

    if (rank_value(hi) == rank_value(lo)) {
        result.description = "Pocket " + rank_label(hi) + "s";
    } else if (get_suit(hi) == get_suit(lo)) {
        result.description = "Suited " + rank_label(hi) + rank_label(lo);
    } else {
        result.description = "Offsuit " + rank_label(hi) + rank_label(lo);
    }
    return result;
}

HandResult evaluate_hand(const std::vector<Card>& cards) {
    if (cards.size() < 2) {
        spdlog::debug("evaluate_hand: {} carte(s) fournie(s), main invalide.", cards.size());
        return invalid_hand_result(INVALID_HOLE_CARDS_DESCRIPTION);
    }
    Bitboard mask = EMPTY_BOARD;
    if (cards.size() > 7 || !cards_to_board(cards, mask)) {
        spdlog::debug("evaluate_hand: ensemble de {} cartes invalide (doublon ou carte hors jeu).",
                      cards.size());
        return invalid_hand_result(INVALID_CARD_SET_DESCRIPTION);
    }

    // Forme canonique : le résultat (cartes utilisées comprises) ne dépend pas de l'ordre
    std::vector<Card> sorted = cards;
    sort_cards_desc(sorted);

    if (sorted.size() == 2) {
        return starting_hand_descriptor(sorted[0], sorted[1]);
    }
    if (sorted.size() < 5) {
        return evaluate_partial(sorted);
    }

    const size_t n = sorted.size();
    HandResult best;
    bool have_best = false;
    std::array<Card, 5> subset{};
    for (size_t a = 0; a < n; ++a)
    for (size_t b = a + 1; b < n; ++b)
    for (size_t c = b + 1; c < n; ++c)
    for (size_t d = c + 1; d < n; ++d)
    for (size_t e = d + 1; e < n; ++e) {
        subset = {sorted[a], sorted[b], sorted[c], sorted[d], sorted[e]};
        HandResult candidate = evaluate_five(subset);
        if (!have_best || compare_hands(candidate, best) > 0) {
            best = std::move(candidate);
            have_best = true;
        }
    }

    if (spdlog::default_logger_raw()->should_log(spdlog::level::trace)) {
        spdlog::trace("evaluate_hand: {} cartes -> {}", n, hand_result_to_string(best));
    }
    return best;
}

HandResult evaluate_hand(const std::vector<Card>& hole_cards, const std::vector<Card>& board) {
    if (hole_cards.size() != 2) {
        return invalid_hand_result(INVALID_HOLE_CARDS_DESCRIPTION);
    }
    std::vector<Card> all_cards = hole_cards;
    all_cards.insert(all_cards.end(), board.begin(), board.end());

    if (all_cards.size() < 5) {
        // Préflop (ou board incomplet) : on ne décrit que la main de départ
        Bitboard mask = EMPTY_BOARD;
        if (!cards_to_board(all_cards, mask)) {
            return invalid_hand_result(INVALID_CARD_SET_DESCRIPTION);
        }
        return starting_hand_descriptor(hole_cards[0], hole_cards[1]);
    }
    return evaluate_hand(all_cards);
}

std::string hand_result_to_string(const HandResult& result) {
    std::stringstream ss;
    ss << result.description << " [";
    for (size_t i = 0; i < result.cards_used.size(); ++i) {
        ss << to_string(result.cards_used[i]);
        if (i + 1 < result.cards_used.size()) ss << " ";
    }
    ss << "] primary=" << result.primary_value
       << " secondary=" << result.secondary_value << " kickers=[";
    for (size_t i = 0; i < result.kickers.size(); ++i) {
        ss << result.kickers[i];
        if (i + 1 < result.kickers.size()) ss << ",";
    }
    ss << "]";
    return ss.str();
}

} // namespace holdem_eval
