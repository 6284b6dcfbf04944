#include "holdem/evaluator_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace holdem_eval {

namespace {

std::string trim_lower(const std::string& raw) {
    const auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = raw.find_last_not_of(" \t\r\n");
    std::string s = raw.substr(first, last - first + 1);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

bool parse_bool(const std::string& name, const std::string& raw) {
    const std::string v = trim_lower(raw);
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no") return false;
    throw ConfigError(name + ": expected a boolean, got '" + raw + "'");
}

long parse_positive(const std::string& name, const std::string& raw) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(raw, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected an integer, got '" + raw + "'");
    }
    if (consumed != raw.size() || value <= 0) {
        throw ConfigError(name + ": expected a positive integer, got '" + raw + "'");
    }
    return value;
}

} // namespace

EvaluatorConfig EvaluatorConfig::from_environment() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    });
}

EvaluatorConfig EvaluatorConfig::from_lookup(const Lookup& lookup) {
    EvaluatorConfig config;

    if (auto v = lookup("HOLDEM_ORACLE_ENABLED")) {
        config.oracle_enabled = parse_bool("HOLDEM_ORACLE_ENABLED", *v);
    }
    if (auto v = lookup("HOLDEM_ORACLE_URL")) {
        if (v->empty()) throw ConfigError("HOLDEM_ORACLE_URL: empty URL");
        config.oracle_url = *v;
    }
    if (auto v = lookup("HOLDEM_ORACLE_TIMEOUT_MS")) {
        config.oracle_timeout = std::chrono::milliseconds(parse_positive("HOLDEM_ORACLE_TIMEOUT_MS", *v));
    }
    if (auto v = lookup("HOLDEM_ORACLE_BUDGET_MS")) {
        config.oracle_budget = std::chrono::milliseconds(parse_positive("HOLDEM_ORACLE_BUDGET_MS", *v));
    }
    if (auto v = lookup("HOLDEM_ORACLE_MAX_IN_FLIGHT")) {
        config.oracle_max_in_flight = static_cast<std::size_t>(parse_positive("HOLDEM_ORACLE_MAX_IN_FLIGHT", *v));
    }
    if (auto v = lookup("HOLDEM_LOG_LEVEL")) {
        const std::string level = trim_lower(*v);
        const auto parsed = spdlog::level::from_str(level);
        // from_str retourne "off" pour un nom inconnu
        if (parsed == spdlog::level::off && level != "off") {
            throw ConfigError("HOLDEM_LOG_LEVEL: unknown level '" + *v + "'");
        }
        config.log_level = parsed;
    }

    // Le budget de l'appelant englobe toujours le délai du transport
    if (config.oracle_budget < config.oracle_timeout) {
        spdlog::warn("EvaluatorConfig: budget oracle {} ms < délai {} ms, budget relevé.",
                     config.oracle_budget.count(), config.oracle_timeout.count());
        config.oracle_budget = config.oracle_timeout;
    }
    return config;
}

} // namespace holdem_eval
