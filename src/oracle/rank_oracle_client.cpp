#include "oracle/rank_oracle_client.hpp"
#include "core/bitboard.hpp"
#include "core/card_json.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <array>
#include <exception>
#include <cstdint>
#include <future>
#include <limits>
#include <system_error>
#include <thread>

namespace holdem_eval {

namespace {

// Échelle du service : 8 couvre à la fois quinte flush et quinte flush royale
constexpr std::array<HandCategory, 9> ORACLE_CATEGORIES = {
    HandCategory::HIGH_CARD,       // 0
    HandCategory::ONE_PAIR,        // 1
    HandCategory::TWO_PAIR,        // 2
    HandCategory::THREE_OF_A_KIND, // 3
    HandCategory::STRAIGHT,        // 4
    HandCategory::FLUSH,           // 5
    HandCategory::FULL_HOUSE,      // 6
    HandCategory::FOUR_OF_A_KIND,  // 7
    HandCategory::STRAIGHT_FLUSH   // 8
};

constexpr size_t FULL_HAND = 5;

// Entier dans [min, max] (max >= 0) ; get<int>() tronquerait un entier 64 bits
int bounded_int(const json& node, const std::string& what, int min, int max) {
    if (!node.is_number_integer()) {
        throw OracleUnavailable(what + " missing or not an integer");
    }
    std::int64_t value = 0;
    if (node.is_number_unsigned()) {
        const auto raw = node.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(max)) {
            throw OracleUnavailable(what + " out of range: " + node.dump());
        }
        value = static_cast<std::int64_t>(raw);
    } else {
        value = node.get<std::int64_t>();
    }
    if (value < min || value > max) {
        throw OracleUnavailable(what + " out of range: " + node.dump());
    }
    return static_cast<int>(value);
}

int require_int(const json& body, const char* key, int min, int max) {
    auto it = body.find(key);
    if (it == body.end()) {
        throw OracleUnavailable(std::string("field '") + key + "' missing or not an integer");
    }
    return bounded_int(*it, std::string("field '") + key + "'", min, max);
}

const json& require_array(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_array()) {
        throw OracleUnavailable(std::string("field '") + key + "' missing or not an array");
    }
    return *it;
}

} // namespace

RankOracleClient::RankOracleClient(std::shared_ptr<HttpTransport> transport,
                                   std::string url,
                                   std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds budget,
                                   std::size_t max_in_flight)
    : transport_(std::move(transport)),
      url_(std::move(url)),
      timeout_(timeout),
      budget_(std::max(budget, timeout)),
      max_in_flight_(max_in_flight),
      in_flight_(std::make_shared<std::atomic<std::size_t>>(0))
{
    if (!transport_) {
        throw std::invalid_argument("RankOracleClient requires a transport");
    }
}

RankOracleClient::RankOracleClient(std::shared_ptr<HttpTransport> transport, const EvaluatorConfig& config)
    : RankOracleClient(std::move(transport), config.oracle_url, config.oracle_timeout,
                       config.oracle_budget, config.oracle_max_in_flight) {}

HandCategory RankOracleClient::category_from_code(int code, int value, const std::vector<Card>& cards_used) {
    if (code < 0 || code >= static_cast<int>(ORACLE_CATEGORIES.size())) {
        throw OracleUnavailable("rank code out of range: " + std::to_string(code));
    }
    HandCategory category = ORACLE_CATEGORIES[static_cast<size_t>(code)];
    if (category != HandCategory::STRAIGHT_FLUSH) {
        return category;
    }

    // Main complète : les cartes tranchent (la roue peut arriver avec value = 14)
    if (cards_used.size() == FULL_HAND) {
        RankMask ranks = 0;
        for (Card c : cards_used) add_rank(ranks, c);
        return straight_high(ranks) == MAX_RANK_VALUE ? HandCategory::ROYAL_FLUSH : category;
    }
    return value == MAX_RANK_VALUE ? HandCategory::ROYAL_FLUSH : category;
}

OracleResult RankOracleClient::parse_response(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        throw OracleUnavailable(std::string("malformed JSON body: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw OracleUnavailable("response body is not a JSON object");
    }

    OracleResult result;
    // Le code lui-même est validé par category_from_code
    result.rank_code = require_int(parsed, "rank", std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    result.value = require_int(parsed, "value", 0, MAX_RANK_VALUE);
    result.second_value = require_int(parsed, "second_value", 0, MAX_RANK_VALUE);

    for (const auto& kicker : require_array(parsed, "kickers")) {
        result.kickers.push_back(bounded_int(kicker, "kicker", 0, MAX_RANK_VALUE));
    }

    try {
        result.cards_used = cards_from_json(require_array(parsed, "cards_used"));
        result.cards = cards_from_json(require_array(parsed, "cards"));
    } catch (const InvalidCardError& e) {
        throw OracleUnavailable(std::string("invalid card in response: ") + e.what());
    }

    result.category = category_from_code(result.rank_code, result.value, result.cards_used);
    return result;
}

std::optional<OracleResult> RankOracleClient::rank(const std::vector<Card>& cards) const {
    try {
        const QueryParams query = {{"cards", cards_to_json(cards).dump()}};

        auto promise = std::make_shared<std::promise<HttpResponse>>();
        std::future<HttpResponse> future = promise->get_future();

        // Borne sur les appels en cours : un oracle lent ne doit pas accumuler de threads
        if (in_flight_->fetch_add(1) >= max_in_flight_) {
            in_flight_->fetch_sub(1);
            throw OracleUnavailable(std::to_string(max_in_flight_) + " calls already in flight");
        }

        try {
            std::thread([transport = transport_, in_flight = in_flight_, promise,
                         url = url_, query, timeout = timeout_]() {
                HttpResponse answer;
                std::exception_ptr error;
                try {
                    answer = transport->get(url, query, timeout);
                } catch (...) {
                    // Transmis à l'appelant via le futur
                    error = std::current_exception();
                }
                in_flight->fetch_sub(1);
                if (error) {
                    promise->set_exception(error);
                } else {
                    promise->set_value(std::move(answer));
                }
            }).detach();
        } catch (const std::system_error& e) {
            in_flight_->fetch_sub(1);
            throw OracleUnavailable(std::string("cannot start worker thread: ") + e.what());
        }

        if (future.wait_for(budget_) != std::future_status::ready) {
            throw OracleUnavailable("no answer within " + std::to_string(budget_.count()) + " ms");
        }

        const HttpResponse response = future.get();
        if (response.status < 200 || response.status >= 300) {
            throw OracleUnavailable("HTTP status " + std::to_string(response.status));
        }

        OracleResult result = parse_response(response.body);
        spdlog::debug("RankOracleClient: code {} -> {} (value={}, second_value={})",
                      result.rank_code, category_to_string(result.category),
                      result.value, result.second_value);
        return result;
    } catch (const OracleUnavailable& e) {
        spdlog::warn("RankOracleClient: oracle indisponible : {}", e.what());
    } catch (const std::exception& e) {
        spdlog::warn("RankOracleClient: appel à l'oracle échoué : {}", e.what());
    }
    return std::nullopt;
}

} // namespace holdem_eval
