#include "core/card_json.hpp"

namespace holdem_eval {

json card_to_json(Card c) {
    return json{{"rank", rank_label(c)}, {"suit", suit_name(c)}};
}

json cards_to_json(const std::vector<Card>& cards) {
    json array = json::array();
    for (Card c : cards) {
        array.push_back(card_to_json(c));
    }
    return array;
}

Card card_from_json(const json& object) {
    if (!object.is_object()) {
        throw InvalidCardError("Card must be a JSON object, got: " + object.dump());
    }
    auto rank_it = object.find("rank");
    auto suit_it = object.find("suit");
    if (rank_it == object.end() || suit_it == object.end() ||
        !rank_it->is_string() || !suit_it->is_string()) {
        throw InvalidCardError("Card needs string fields 'rank' and 'suit': " + object.dump());
    }
    return parse_card(rank_it->get<std::string>(), suit_it->get<std::string>());
}

std::vector<Card> cards_from_json(const json& array) {
    if (!array.is_array()) {
        throw InvalidCardError("Cards must be a JSON array, got: " + array.dump());
    }
    std::vector<Card> cards;
    cards.reserve(array.size());
    for (const auto& element : array) {
        cards.push_back(card_from_json(element));
    }
    return cards;
}

} // namespace holdem_eval
