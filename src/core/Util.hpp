//
// Created by Malik T on 14/08/2025.
//

#ifndef KLONDIKE_UTIL_HPP
#define KLONDIKE_UTIL_HPP

#include <algorithm>
#include <bit>
#include <numeric>
#include "State.hpp"

namespace klondike::core::util
{
    // 0..51, ignores face-up state
    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(c.suit()) * constants::RanksPerSuit
             + static_cast<uint64_t>(RankValue(c.rank()) - 1);
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto DistinctCount() const -> size_t
        {
            return static_cast<size_t>(std::popcount(cards_));
        }
        // every one of the 52 cards seen exactly once
        [[nodiscard]]
        auto IsFullDeck(size_t const total_added) const -> bool
        {
            return !contains_dup_ && total_added == constants::DeckSize && DistinctCount() == constants::DeckSize;
        }
    private:
        uint64_t cards_;
        bool contains_dup_;
    };

    template <typename Fn>
    inline auto ForEachPile(GameState const& s, Fn&& fn) -> void
    {
        fn(s.stock);
        fn(s.waste);
        for (Pile const& p : s.foundations) fn(p);
        for (Pile const& p : s.tableau) fn(p);
    }

    inline auto TotalCards(GameState const& s) -> size_t
    {
        size_t n{};
        ForEachPile(s, [&n](Pile const& p) { n += p.size(); });
        return n;
    }

    inline auto FoundationTotal(GameState const& s) -> size_t
    {
        return std::accumulate(s.foundations.cbegin(), s.foundations.cend(), size_t{0},
                               [](size_t acc, Pile const& p) { return acc + p.size(); });
    }

    inline auto HoldsFullDeck(GameState const& s) -> bool
    {
        CardUniqueChecker checker{};
        ForEachPile(s, [&checker](Pile const& p)
        {
            std::ranges::for_each(p, [&checker](Card const& c) { checker.Add(c); });
        });
        return checker.IsFullDeck(TotalCards(s));
    }
}

#endif //KLONDIKE_UTIL_HPP
