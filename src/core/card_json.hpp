#ifndef HOLDEM_CARD_JSON_HPP
#define HOLDEM_CARD_JSON_HPP

#include "core/cards.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace holdem_eval {

using json = nlohmann::json;

// {"rank": "10", "suit": "hearts"}
json card_to_json(Card c);
json cards_to_json(const std::vector<Card>& cards);

/**
 * @brief Décode un tableau JSON de cartes {rank, suit}.
 * @throws InvalidCardError si un élément n'a pas la bonne forme ou des valeurs inconnues.
 */
std::vector<Card> cards_from_json(const json& array);
Card card_from_json(const json& object);

} // namespace holdem_eval

#endif // HOLDEM_CARD_JSON_HPP
