//
// Created by Malik T on 15/08/2025.
//

#ifndef KLONDIKE_RULES_HPP
#define KLONDIKE_RULES_HPP

#include "State.hpp"
#include "Types.hpp"

// Pure placement/pick predicates. Nothing here mutates or throws on bad input;
// an out-of-range index is simply not legal.
namespace klondike::core::rules
{
    inline constexpr std::array<Suit, constants::FoundationCount> FoundationSuitOrder{
        Suit::Hearts, Suit::Diamonds, Suit::Clubs, Suit::Spades};

    auto FoundationSuit(size_t foundation_idx) -> Suit;

    auto CanPlaceOnTableau(Card const& card, Pile const& pile) -> bool;
    auto CanPlaceOnFoundation(Card const& card, Pile const& pile, Suit expected_suit) -> bool;

    auto CanPickFromTableau(Pile const& pile, size_t index) -> bool;
    auto CanPickFromWaste(GameState const& state) -> bool;
    auto CanDrawFromStock(GameState const& state) -> bool;

    // Ascending pile indices; callers rely on the order for highlighting.
    auto ValidTableauDestinations(Card const& card, GameState const& state) -> std::vector<size_t>;
    auto ValidFoundationDestinations(Card const& card, GameState const& state) -> std::vector<size_t>;

    // pile[index..] is face-up, strictly descending and strictly alternating in colour
    auto IsMovableRun(Pile const& pile, size_t index) -> bool;
}

#endif //KLONDIKE_RULES_HPP
