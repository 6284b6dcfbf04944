#ifndef HOLDEM_HAND_STRENGTH_CLASSIFIER_H
#define HOLDEM_HAND_STRENGTH_CLASSIFIER_H

#include "holdem/common_types.h"
#include "holdem/evaluator_config.h"
#include "holdem/hybrid_hand_ranker.h"
#include "eval/board_texture.hpp"
#include <vector>

namespace holdem_eval {

/**
 * @brief Ramène une main à un palier de force (StrengthTier).
 *
 * Fonction sans état de (cartes privées, board, heads-up).
 * Préflop : prédicats testés dans l'ordre STRONG > DECENT > WEAK_PLAYABLE > MARGINAL.
 * Postflop : catégorie du HybridHandRanker puis ajustement selon la texture du board.
 */
class HandStrengthClassifier {
public:
    HandStrengthClassifier(const ClassifierThresholds& thresholds, const HybridHandRanker& ranker);

    StrengthTier classify(const std::vector<Card>& hole_cards,
                          const std::vector<Card>& board,
                          bool heads_up = false) const;

    // Palier postflop d'un résultat déjà calculé
    StrengthTier classify_result(const std::vector<Card>& hole_cards,
                                 const std::vector<Card>& board,
                                 const HandResult& result) const;

    StrengthTier classify_preflop(const std::vector<Card>& hole_cards, bool heads_up = false) const;

    // Prédicats préflop ; faux si hole_cards n'a pas 2 cartes valides
    bool has_strong_hand(const std::vector<Card>& hole_cards) const;
    bool has_decent_hand(const std::vector<Card>& hole_cards, bool heads_up = false) const;
    bool has_weak_playable_hand(const std::vector<Card>& hole_cards, bool heads_up = false) const;
    bool has_marginal_hand(const std::vector<Card>& hole_cards) const;

    // Paire de dix ou mieux après le flop, sinon has_strong_hand
    bool strong_with_community(const std::vector<Card>& hole_cards,
                               const std::vector<Card>& board) const;

private:
    StrengthTier base_postflop_tier(const HandResult& result, const BoardTexture& texture) const;

    const ClassifierThresholds& thresholds_;
    const HybridHandRanker& ranker_;
};

} // namespace holdem_eval

#endif // HOLDEM_HAND_STRENGTH_CLASSIFIER_H
