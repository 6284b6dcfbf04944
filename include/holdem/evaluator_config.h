#ifndef HOLDEM_EVALUATOR_CONFIG_H
#define HOLDEM_EVALUATOR_CONFIG_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "spdlog/spdlog.h"

namespace holdem_eval {

class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what_arg)
        : std::invalid_argument(what_arg) {}
};

// Seuils de classification. Les valeurs par défaut sont la grille de référence ;
// les seuils heads-up élargissent DECENT / WEAK_PLAYABLE sans jamais les restreindre.
struct ClassifierThresholds {
    // Préflop
    int strong_pair_min          = 10; // TT+
    int decent_high_card_min     = 9;
    int decent_suited_gap_max    = 2;
    int weak_connected_gap_max   = 1;
    int weak_high_card_min       = 11;
    int weak_both_cards_min      = 8;
    int marginal_high_card_min   = 10;
    int marginal_suited_gap_max  = 3;
    int marginal_gap_max         = 2;

    // Élargissement heads-up
    int heads_up_decent_suited_gap_max = 3;
    int heads_up_decent_both_cards_min = 7;
    int heads_up_weak_high_card_min    = 8;
    int heads_up_weak_gap_max          = 2;

    // Postflop
    int strong_pair_min_postflop = 13; // top pair As/Roi
    int decent_pair_min_postflop = 10;
    int strong_two_pair_min      = 10;
    int flush_draw_cards         = 3;
    int straight_draw_ranks      = 3; // dans une fenêtre de 5 rangs
};

/**
 * @brief Configuration immuable construite une fois au démarrage puis injectée.
 */
struct EvaluatorConfig {
    bool                      oracle_enabled       = true;
    std::string               oracle_url           = "https://rainman.leanpoker.org/rank";
    std::chrono::milliseconds oracle_timeout       {3000}; // délai dur du transport
    std::chrono::milliseconds oracle_budget        {5000}; // délai vu par l'appelant
    std::size_t               oracle_max_in_flight = 4;
    ClassifierThresholds      thresholds;
    spdlog::level::level_enum log_level            = spdlog::level::info;

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Surcharges HOLDEM_* lues dans l'environnement du processus
    static EvaluatorConfig from_environment();

    // Même chose avec une source de variables injectée (tests)
    static EvaluatorConfig from_lookup(const Lookup& lookup);
};

} // namespace holdem_eval

#endif // HOLDEM_EVALUATOR_CONFIG_H
