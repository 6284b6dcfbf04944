#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace holdem_eval {

Deck::Deck(uint32_t seed)
    : cards_(NUM_CARDS),
      next_card_index_(0),
      rng_(seed)
{
    std::iota(cards_.begin(), cards_.end(), static_cast<Card>(0));
    shuffle();
}

void Deck::reset() {
    cards_.resize(NUM_CARDS);
    std::iota(cards_.begin(), cards_.end(), static_cast<Card>(0));
    shuffle();
}

Card Deck::deal_card() {
    if (next_card_index_ >= cards_.size()) {
        throw std::runtime_error("Deck is empty, cannot deal card.");
    }
    return cards_[next_card_index_++];
}

std::vector<Card> Deck::deal(size_t count) {
    if (count > remaining()) {
        throw std::runtime_error("Deck has only " + std::to_string(remaining()) +
                                 " cards left, cannot deal " + std::to_string(count) + ".");
    }
    std::vector<Card> out(cards_.begin() + next_card_index_,
                          cards_.begin() + next_card_index_ + count);
    next_card_index_ += count;
    return out;
}

void Deck::shuffle() {
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    next_card_index_ = 0;
}

void Deck::remove_cards(const std::vector<Card>& dead) {
    Bitboard dead_mask = EMPTY_BOARD;
    for (Card c : dead) set_card(dead_mask, c);
    cards_.erase(std::remove_if(cards_.begin(), cards_.end(),
                                [&](Card c) { return test_card(dead_mask, c); }),
                 cards_.end());
    next_card_index_ = std::min(next_card_index_, cards_.size());
}

} // namespace holdem_eval
