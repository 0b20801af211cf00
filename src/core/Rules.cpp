//
// Created by Malik T on 15/08/2025.
//

#include "Rules.hpp"

#include <ranges>
#include <algorithm>

namespace klondike::core::rules
{
    auto FoundationSuit(size_t const foundation_idx) -> Suit
    {
        return FoundationSuitOrder.at(foundation_idx);
    }

    auto CanPlaceOnTableau(Card const& card, Pile const& pile) -> bool
    {
        if (pile.empty()) return card.rank() == Rank::King;

        Card const& top = pile.back();
        if (!top.face_up()) return false;
        if (!card.IsOppositeColour(top)) return false;
        return RankValue(card.rank()) + 1 == RankValue(top.rank());
    }

    auto CanPlaceOnFoundation(Card const& card, Pile const& pile, Suit const expected_suit) -> bool
    {
        if (card.suit() != expected_suit) return false;
        if (pile.empty()) return card.rank() == Rank::Ace;
        return RankValue(card.rank()) == RankValue(pile.back().rank()) + 1;
    }

    auto CanPickFromTableau(Pile const& pile, size_t const index) -> bool
    {
        return index < pile.size() && pile[index].face_up();
    }

    auto CanPickFromWaste(GameState const& state) -> bool
    {
        return !state.waste.empty();
    }

    auto CanDrawFromStock(GameState const& state) -> bool
    {
        return !state.stock.empty();
    }

    auto ValidTableauDestinations(Card const& card, GameState const& state) -> std::vector<size_t>
    {
        std::vector<size_t> valid;
        for (size_t i{}; i < state.tableau.size(); ++i)
        {
            if (CanPlaceOnTableau(card, state.tableau[i])) valid.push_back(i);
        }
        return valid;
    }

    auto ValidFoundationDestinations(Card const& card, GameState const& state) -> std::vector<size_t>
    {
        std::vector<size_t> valid;
        for (size_t i{}; i < state.foundations.size(); ++i)
        {
            if (CanPlaceOnFoundation(card, state.foundations[i], FoundationSuit(i))) valid.push_back(i);
        }
        return valid;
    }

    auto IsMovableRun(Pile const& pile, size_t const index) -> bool
    {
        if (!CanPickFromTableau(pile, index)) return false;

        auto const run = pile | std::views::drop(index);
        return std::ranges::all_of(run, [](Card const& c) { return c.face_up(); })
            && std::ranges::adjacent_find(run, [](Card const& upper, Card const& lower)
               {
                   return !(upper.IsOppositeColour(lower)
                            && RankValue(upper.rank()) == RankValue(lower.rank()) + 1);
               }) == run.end();
    }
}
