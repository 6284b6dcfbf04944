#ifndef HOLDEM_HYBRID_HAND_RANKER_H
#define HOLDEM_HYBRID_HAND_RANKER_H

#include "holdem/common_types.h"
#include "holdem/evaluator_config.h"
#include "eval/hand_evaluator.hpp"
#include "oracle/rank_oracle_client.hpp"
#include <memory>
#include <vector>

namespace holdem_eval {

struct RankedHand {
    HandResult       result;
    EvaluationSource source = EvaluationSource::LOCAL;
};

class HybridHandRanker {
public:
    // oracle nul => évaluation locale uniquement
    explicit HybridHandRanker(const EvaluatorConfig& config,
                              std::shared_ptr<const RankOracleClient> oracle = nullptr);

    /**
     * @brief Meilleure main de hole_cards + board.
     *
     * L'oracle n'est interrogé qu'avec 5 cartes valides et distinctes au moins.
     * Toute panne retombe sur l'évaluateur local, qui donne la même catégorie.
     */
    RankedHand evaluate(const std::vector<Card>& hole_cards,
                        const std::vector<Card>& board) const;

    bool oracle_enabled() const { return oracle_ != nullptr; }

    // Traduction d'un résultat de l'oracle vers les conventions de HandResult
    static HandResult from_oracle(const OracleResult& oracle_result);

private:
    std::shared_ptr<const RankOracleClient> oracle_;
};

} // namespace holdem_eval

#endif // HOLDEM_HYBRID_HAND_RANKER_H
