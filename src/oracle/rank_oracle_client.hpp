#ifndef HOLDEM_RANK_ORACLE_CLIENT_HPP
#define HOLDEM_RANK_ORACLE_CLIENT_HPP

#include "core/cards.hpp"
#include "eval/hand_evaluator.hpp"
#include "holdem/evaluator_config.h"
#include "oracle/http_transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace holdem_eval {

// Réponse décodée du service de classement
struct OracleResult {
    int               rank_code = 0;  // échelle 0-8 du service
    HandCategory      category = HandCategory::HIGH_CARD;
    int               value = 0;
    int               second_value = 0;
    std::vector<int>  kickers;
    std::vector<Card> cards_used;
    std::vector<Card> cards;
};

// Toute panne de l'oracle (délai, statut, corps invalide) est ramenée à ce type
class OracleUnavailable : public std::runtime_error {
public:
    explicit OracleUnavailable(const std::string& what_arg)
        : std::runtime_error(what_arg) {}
};

/**
 * @brief Adaptateur du service externe de classement de mains.
 *
 * Une seule tentative par appel, sans retry : le transport reçoit le délai
 * dur (oracle_timeout) et l'appelant n'attend jamais plus que oracle_budget.
 * Une réponse arrivée après le budget est ignorée. Aucune exception ne sort
 * de rank().
 */
class RankOracleClient {
public:
    RankOracleClient(std::shared_ptr<HttpTransport> transport,
                     std::string url,
                     std::chrono::milliseconds timeout,
                     std::chrono::milliseconds budget,
                     std::size_t max_in_flight);

    RankOracleClient(std::shared_ptr<HttpTransport> transport, const EvaluatorConfig& config);

    // std::nullopt = oracle indisponible
    std::optional<OracleResult> rank(const std::vector<Card>& cards) const;

    /**
     * @brief Décode le corps JSON d'une réponse.
     * @throws OracleUnavailable si le schéma n'est pas respecté.
     */
    static OracleResult parse_response(const std::string& body);

    // Table 0-8 -> catégorie ; le code 8 avec un As en tête devient ROYAL_FLUSH
    static HandCategory category_from_code(int code, int value, const std::vector<Card>& cards_used);

    std::size_t in_flight() const { return in_flight_->load(); }

private:
    std::shared_ptr<HttpTransport>           transport_;
    std::string                              url_;
    std::chrono::milliseconds                timeout_;
    std::chrono::milliseconds                budget_;
    std::size_t                              max_in_flight_;
    // Partagé avec les threads de travail détachés, qui peuvent survivre au client
    std::shared_ptr<std::atomic<std::size_t>> in_flight_;
};

} // namespace holdem_eval

#endif // HOLDEM_RANK_ORACLE_CLIENT_HPP
