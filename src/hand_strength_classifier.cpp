#include "holdem/hand_strength_classifier.h"
#include "holdem/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace holdem_eval {

namespace {

constexpr size_t FLOP_CARDS = 3;

struct HoleShape {
    int  high = 0;
    int  low = 0;
    bool pair = false;
    bool suited = false;
    int  gap = 0;
};

bool read_hole(const std::vector<Card>& hole_cards, HoleShape& shape) {
    if (hole_cards.size() != 2) return false;
    Card c1 = hole_cards[0];
    Card c2 = hole_cards[1];
    if (!is_valid_card(c1) || !is_valid_card(c2) || c1 == c2) return false;

    shape.high = std::max(rank_value(c1), rank_value(c2));
    shape.low = std::min(rank_value(c1), rank_value(c2));
    shape.pair = shape.high == shape.low;
    shape.suited = get_suit(c1) == get_suit(c2);
    shape.gap = shape.high - shape.low;
    return true;
}

// Un cran de moins, sans descendre sous WEAK_PLAYABLE
StrengthTier demote(StrengthTier tier) {
    if (tier <= StrengthTier::WEAK_PLAYABLE) return tier;
    return static_cast<StrengthTier>(static_cast<int>(tier) - 1);
}

} // namespace

HandStrengthClassifier::HandStrengthClassifier(const ClassifierThresholds& thresholds,
                                               const HybridHandRanker& ranker)
    : thresholds_(thresholds), ranker_(ranker) {}

bool HandStrengthClassifier::has_strong_hand(const std::vector<Card>& hole_cards) const {
    HoleShape h;
    if (!read_hole(hole_cards, h)) return false;

    if (h.pair && h.high >= thresholds_.strong_pair_min) return true;
    // AK, AQ
    return h.high == 14 && (h.low == 13 || h.low == 12);
}

bool HandStrengthClassifier::has_decent_hand(const std::vector<Card>& hole_cards, bool heads_up) const {
    HoleShape h;
    if (!read_hole(hole_cards, h)) return false;

    if (h.pair) return true;
    if (h.high >= thresholds_.decent_high_card_min) return true;
    if (h.suited && h.gap <= thresholds_.decent_suited_gap_max) return true;
    if (h.high == 14 || h.high == 13) return true;
    if (h.low >= BROADWAY_MIN_VALUE) return true;

    if (heads_up) {
        if (h.suited && h.gap <= thresholds_.heads_up_decent_suited_gap_max) return true;
        if (h.low >= thresholds_.heads_up_decent_both_cards_min) return true;
    }
    return false;
}

bool HandStrengthClassifier::has_weak_playable_hand(const std::vector<Card>& hole_cards, bool heads_up) const {
    HoleShape h;
    if (!read_hole(hole_cards, h)) return false;

    if (h.suited) return true;
    if (h.gap <= thresholds_.weak_connected_gap_max) return true;
    if (h.high >= thresholds_.weak_high_card_min) return true;
    if (h.low >= thresholds_.weak_both_cards_min) return true;

    if (heads_up) {
        if (h.high >= thresholds_.heads_up_weak_high_card_min) return true;
        if (h.gap <= thresholds_.heads_up_weak_gap_max) return true;
    }
    return false;
}

bool HandStrengthClassifier::has_marginal_hand(const std::vector<Card>& hole_cards) const {
    HoleShape h;
    if (!read_hole(hole_cards, h)) return false;

    return h.high >= thresholds_.marginal_high_card_min
        || (h.suited && h.gap <= thresholds_.marginal_suited_gap_max)
        || h.gap <= thresholds_.marginal_gap_max;
}

StrengthTier HandStrengthClassifier::classify_preflop(const std::vector<Card>& hole_cards, bool heads_up) const {
    if (has_strong_hand(hole_cards)) return StrengthTier::STRONG;
    if (has_decent_hand(hole_cards, heads_up)) return StrengthTier::DECENT;
    if (has_weak_playable_hand(hole_cards, heads_up)) return StrengthTier::WEAK_PLAYABLE;
    if (has_marginal_hand(hole_cards)) return StrengthTier::MARGINAL;
    return StrengthTier::TRASH;
}

StrengthTier HandStrengthClassifier::base_postflop_tier(const HandResult& result,
                                                        const BoardTexture& texture) const {
    switch (result.category) {
        case HandCategory::ROYAL_FLUSH:
        case HandCategory::STRAIGHT_FLUSH:
        case HandCategory::FOUR_OF_A_KIND:
        case HandCategory::FULL_HOUSE:
        case HandCategory::FLUSH:
            return StrengthTier::PREMIUM;
        case HandCategory::STRAIGHT:
            return (texture.flush_possible || texture.pair_on_board)
                ? StrengthTier::STRONG : StrengthTier::PREMIUM;
        case HandCategory::THREE_OF_A_KIND:
            return StrengthTier::STRONG;
        case HandCategory::TWO_PAIR:
            return result.primary_value >= thresholds_.strong_two_pair_min
                ? StrengthTier::STRONG : StrengthTier::DECENT;
        case HandCategory::ONE_PAIR:
            if (result.primary_value >= thresholds_.strong_pair_min_postflop) return StrengthTier::STRONG;
            if (result.primary_value >= thresholds_.decent_pair_min_postflop) return StrengthTier::DECENT;
            return texture.coordinated ? StrengthTier::WEAK_PLAYABLE : StrengthTier::DECENT;
        case HandCategory::HIGH_CARD:
        default:
            return StrengthTier::MARGINAL;
    }
}

StrengthTier HandStrengthClassifier::classify_result(const std::vector<Card>& hole_cards,
                                                     const std::vector<Card>& board,
                                                     const HandResult& result) const {
    if (is_invalid_result(result)) return StrengthTier::TRASH;

    const BoardTexture texture = analyze_board(board);
    StrengthTier tier = base_postflop_tier(result, texture);

    switch (result.category) {
        case HandCategory::ONE_PAIR:
        case HandCategory::TWO_PAIR:
            if (texture.pair_on_board || texture.flush_possible) {
                tier = demote(tier);
            }
            break;
        case HandCategory::HIGH_CARD: {
            const DrawPotential draws = analyze_draws(hole_cards, board,
                                                      thresholds_.flush_draw_cards,
                                                      thresholds_.straight_draw_ranks);
            if (draws.live()) {
                spdlog::trace("HandStrengthClassifier: tirage vivant ({} overcards, couleur={}, quinte={})",
                              draws.overcards, draws.flush_draw, draws.straight_draw);
                tier = StrengthTier::WEAK_PLAYABLE;
            }
            break;
        }
        default:
            break;
    }
    return tier;
}

StrengthTier HandStrengthClassifier::classify(const std::vector<Card>& hole_cards,
                                              const std::vector<Card>& board,
                                              bool heads_up) const {
    HoleShape shape;
    if (!read_hole(hole_cards, shape)) {
        spdlog::debug("HandStrengthClassifier: cartes privées invalides {}", vec_to_string(hole_cards));
        return StrengthTier::TRASH;
    }

    // 1-2 cartes communes : street mal formée, traitée comme préflop
    if (board.size() < FLOP_CARDS) {
        return classify_preflop(hole_cards, heads_up);
    }

    const RankedHand ranked = ranker_.evaluate(hole_cards, board);
    const StrengthTier tier = classify_result(hole_cards, board, ranked.result);
    spdlog::debug("HandStrengthClassifier: {} ({}) -> {} [{}]",
                  hand_to_string(hole_cards, board),
                  street_to_string(street_from_board_size(board.size())),
                  tier_to_string(tier), source_to_string(ranked.source));
    return tier;
}

bool HandStrengthClassifier::strong_with_community(const std::vector<Card>& hole_cards,
                                                   const std::vector<Card>& board) const {
    if (hole_cards.size() != 2) return false;
    if (board.size() < FLOP_CARDS) return has_strong_hand(hole_cards);

    const HandResult result = ranker_.evaluate(hole_cards, board).result;
    if (is_invalid_result(result)) return false;
    if (result.category == HandCategory::ONE_PAIR) {
        return result.primary_value >= thresholds_.decent_pair_min_postflop;
    }
    return result.category > HandCategory::ONE_PAIR;
}

} // namespace holdem_eval
