//
// Created by Malik T on 16/08/2025.
//

#ifndef KLONDIKE_DEALER_HPP
#define KLONDIKE_DEALER_HPP

#include "State.hpp"

namespace klondike::core
{
    class Dealer
    {
    public:
        // 52 face-down cards, suit-major in foundation suit order, Ace..King
        static auto BuildDeck() -> std::vector<Card>;

        // Same seed, same order on a given standard library
        static auto Shuffle(std::vector<Card> deck, uint64_t seed) -> std::vector<Card>;

        // Tableau pile i gets i+1 cards with only the last one face-up; the remaining 24 form the stock.
        static auto Deal(uint64_t seed) -> GameState;
    };
}

#endif //KLONDIKE_DEALER_HPP
