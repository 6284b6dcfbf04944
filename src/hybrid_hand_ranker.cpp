#include "holdem/hybrid_hand_ranker.h"
#include "holdem/game_utils.hpp"
#include "core/bitboard.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <functional>

namespace holdem_eval {

HybridHandRanker::HybridHandRanker(const EvaluatorConfig& config,
                                   std::shared_ptr<const RankOracleClient> oracle)
    : oracle_(config.oracle_enabled ? std::move(oracle) : nullptr) {}

HandResult HybridHandRanker::from_oracle(const OracleResult& oracle_result) {
    HandResult result;
    result.category = oracle_result.category;
    result.primary_value = oracle_result.value;
    result.description = category_to_string(result.category);
    result.cards_used = oracle_result.cards_used;
    sort_cards_desc(result.cards_used);

    const bool complete = result.cards_used.size() == 5;

    switch (result.category) {
        case HandCategory::TWO_PAIR:
        case HandCategory::FULL_HOUSE:
            result.secondary_value = oracle_result.second_value;
            break;
        case HandCategory::STRAIGHT:
        case HandCategory::STRAIGHT_FLUSH:
        case HandCategory::ROYAL_FLUSH:
            // La roue : l'oracle peut annoncer l'As, la hauteur retenue est 5
            if (complete) {
                RankMask mask = 0;
                for (Card c : result.cards_used) add_rank(mask, c);
                int high = straight_high(mask);
                if (high != 0) result.primary_value = high;
            }
            return result; // pas de kicker pour une suite
        case HandCategory::HIGH_CARD:
        case HandCategory::FLUSH:
            if (complete) result.primary_value = rank_value(result.cards_used.front());
            break;
        default:
            break;
    }

    if (complete) {
        // Kickers = cartes utilisées hors rangs primaire/secondaire
        for (Card c : result.cards_used) {
            int v = rank_value(c);
            if (v == result.primary_value) continue;
            if (result.secondary_value != 0 && v == result.secondary_value) continue;
            result.kickers.push_back(v);
        }
    } else {
        result.kickers = oracle_result.kickers;
    }
    std::sort(result.kickers.begin(), result.kickers.end(), std::greater<int>());
    return result;
}

RankedHand HybridHandRanker::evaluate(const std::vector<Card>& hole_cards,
                                      const std::vector<Card>& board) const {
    if (hole_cards.size() != 2) {
        return {invalid_hand_result(INVALID_HOLE_CARDS_DESCRIPTION), EvaluationSource::LOCAL};
    }

    std::vector<Card> all_cards = hole_cards;
    all_cards.insert(all_cards.end(), board.begin(), board.end());

    Bitboard mask = EMPTY_BOARD;
    const bool distinct = cards_to_board(all_cards, mask);

    if (oracle_ && distinct && all_cards.size() >= 5 && all_cards.size() <= 7) {
        if (auto answer = oracle_->rank(all_cards)) {
            spdlog::debug("HybridHandRanker: {} classé par l'oracle ({})",
                          vec_to_string(all_cards), category_to_string(answer->category));
            return {from_oracle(*answer), EvaluationSource::ORACLE};
        }
        spdlog::debug("HybridHandRanker: repli local pour {}", vec_to_string(all_cards));
    }

    return {evaluate_hand(hole_cards, board), EvaluationSource::LOCAL};
}

} // namespace holdem_eval
