#include "holdem/evaluator_config.h"
#include "holdem/hybrid_hand_ranker.h"
#include "holdem/hand_strength_classifier.h"
#include "holdem/game_utils.hpp"
#include "core/card_json.hpp"
#include "oracle/curl_http_transport.hpp"
#include "oracle/rank_oracle_client.hpp"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cout, std::cerr
#include <memory>     // std::make_shared
#include <string>     // std::string
#include <vector>     // std::vector
#include <exception>  // std::exception

namespace {

constexpr int EXIT_INVALID_INPUT = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* program) {
    std::cerr << "Usage : " << program
              << " '<hole json>' ['<board json>'] [--heads-up] [--no-oracle] [--verbose]\n"
              << "  ex. : " << program
              << " '[{\"rank\":\"A\",\"suit\":\"spades\"},{\"rank\":\"K\",\"suit\":\"spades\"}]'\n";
}

std::string join_ints(const std::vector<int>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ' ';
        out += std::to_string(values[i]);
    }
    return out;
}

} // namespace

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Arguments
    // ─────────────────────────────────────────────────────────────
    std::vector<std::string> positional;
    bool heads_up = false;
    bool no_oracle = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--heads-up")       heads_up = true;
        else if (arg == "--no-oracle") no_oracle = true;
        else if (arg == "--verbose")   verbose = true;
        else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Option inconnue : " << arg << '\n';
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
        else positional.push_back(arg);
    }

    if (positional.empty() || positional.size() > 2) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // ─────────────────────────────────────────────────────────────
    // Configuration et logging
    // ─────────────────────────────────────────────────────────────
    holdem_eval::EvaluatorConfig config;
    try {
        config = holdem_eval::EvaluatorConfig::from_environment();
    } catch (const holdem_eval::ConfigError& e) {
        std::cerr << "Configuration invalide : " << e.what() << '\n';
        return EXIT_USAGE;
    }
    if (no_oracle) config.oracle_enabled = false;

    spdlog::set_level(verbose ? spdlog::level::debug : config.log_level);
    spdlog::debug("Oracle {} ({}, délai {} ms, budget {} ms)",
                  config.oracle_enabled ? "activé" : "désactivé", config.oracle_url,
                  config.oracle_timeout.count(), config.oracle_budget.count());

    // ─────────────────────────────────────────────────────────────
    // Cartes
    // ─────────────────────────────────────────────────────────────
    std::vector<holdem_eval::Card> hole_cards;
    std::vector<holdem_eval::Card> board;
    try {
        hole_cards = holdem_eval::cards_from_json(holdem_eval::json::parse(positional[0]));
        if (positional.size() == 2) {
            board = holdem_eval::cards_from_json(holdem_eval::json::parse(positional[1]));
        }
    } catch (const holdem_eval::json::parse_error& e) {
        spdlog::error("JSON invalide : {}", e.what());
        std::cerr << "JSON invalide : " << e.what() << '\n';
        return EXIT_INVALID_INPUT;
    } catch (const holdem_eval::InvalidCardError& e) {
        spdlog::error("Carte invalide : {}", e.what());
        std::cerr << "Carte invalide : " << e.what() << '\n';
        return EXIT_INVALID_INPUT;
    }

    // ─────────────────────────────────────────────────────────────
    // Évaluation
    // ─────────────────────────────────────────────────────────────
    try
    {
        std::shared_ptr<const holdem_eval::RankOracleClient> oracle;
        if (config.oracle_enabled) {
            oracle = std::make_shared<const holdem_eval::RankOracleClient>(
                std::make_shared<holdem_eval::CurlHttpTransport>(), config);
        }

        holdem_eval::HybridHandRanker ranker(config, oracle);
        holdem_eval::HandStrengthClassifier classifier(config.thresholds, ranker);

        const holdem_eval::RankedHand ranked = ranker.evaluate(hole_cards, board);
        const holdem_eval::StrengthTier tier = board.size() >= 3
            ? classifier.classify_result(hole_cards, board, ranked.result)
            : classifier.classify(hole_cards, board, heads_up);

        std::cout << "Main        : " << holdem_eval::hand_to_string(hole_cards, board) << '\n'
                  << "Street      : " << holdem_eval::street_to_string(
                         holdem_eval::street_from_board_size(board.size())) << '\n'
                  << "Description : " << ranked.result.description << '\n'
                  << "Catégorie   : " << holdem_eval::category_to_string(ranked.result.category) << '\n'
                  << "Primaire    : " << ranked.result.primary_value << '\n'
                  << "Secondaire  : " << ranked.result.secondary_value << '\n'
                  << "Kickers     : " << join_ints(ranked.result.kickers) << '\n'
                  << "Source      : " << holdem_eval::source_to_string(ranked.source) << '\n'
                  << "Palier      : " << holdem_eval::tier_to_string(tier) << '\n';
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    return 0;
}
