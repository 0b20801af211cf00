//
// Created by Malik T on 16/08/2025.
//

#include "Dealer.hpp"

#include <algorithm>
#include <random>
#include "Exception.hpp"

namespace klondike::core
{
    auto Dealer::BuildDeck() -> std::vector<Card>
    {
        std::vector<Card> deck;
        deck.reserve(constants::DeckSize);
        for (Suit const suit : AllSuits)
        {
            for (int r = RankValue(Rank::Ace); r <= RankValue(Rank::King); ++r)
            {
                deck.emplace_back(static_cast<Rank>(r), suit, false);
            }
        }
        return deck;
    }

    auto Dealer::Shuffle(std::vector<Card> deck, uint64_t const seed) -> std::vector<Card>
    {
        std::mt19937_64 rng{seed};
        std::ranges::shuffle(deck, rng);
        return deck;
    }

    auto Dealer::Deal(uint64_t const seed) -> GameState
    {
        std::vector<Card> const shuffled = Shuffle(BuildDeck(), seed);
        KLD_ASSERT(shuffled.size() == constants::DeckSize, "Deck does not hold 52 cards after shuffle");

        GameState state{};
        size_t next{};
        for (size_t pile_idx{}; pile_idx < constants::TableauCount; ++pile_idx)
        {
            Pile& pile = state.tableau[pile_idx];
            size_t const pile_size = pile_idx + 1;
            pile.reserve(pile_size);
            for (size_t k{}; k < pile_size; ++k)
            {
                Card const& card = shuffled[next++];
                pile.push_back(k + 1 == pile_size ? card.FaceUp() : card);
            }
        }

        state.stock.assign(shuffled.begin() + static_cast<std::ptrdiff_t>(next), shuffled.end());
        return state;
    }
}
