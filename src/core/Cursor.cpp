//
// Created by Malik T on 17/08/2025.
//

#include "Cursor.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace klondike::core::nav
{
    namespace
    {
        constexpr size_t LastFoundation = constants::FoundationCount - 1;
        constexpr size_t LastTableau = constants::TableauCount - 1;

        using Rule = auto (*)(Cursor, GameState const&) -> Cursor;

        auto At(Zone const zone, size_t const pile = 0) -> Cursor
        {
            return Cursor{.zone = zone, .pile_index = pile, .card_index = 0};
        }

        auto EnterTableau(size_t const pile, GameState const& state) -> Cursor
        {
            return SnapToSelectable(At(Zone::Tableau, pile), state);
        }

        // out-of-range input from outside is pulled onto the board before any rule runs
        auto Normalise(Cursor c) -> Cursor
        {
            switch (c.zone)
            {
            case Zone::Stock:
            case Zone::Waste:
                c.pile_index = 0;
                c.card_index = 0;
                break;
            case Zone::Foundation:
                c.pile_index = std::min(c.pile_index, LastFoundation);
                c.card_index = 0;
                break;
            case Zone::Tableau:
                c.pile_index = std::min(c.pile_index, LastTableau);
                break;
            }
            return c;
        }

        auto Stay(Cursor c, GameState const&) -> Cursor { return c; }

        auto StockDown(Cursor, GameState const& s) -> Cursor { return EnterTableau(0, s); }
        auto StockRight(Cursor, GameState const&) -> Cursor { return At(Zone::Waste); }

        auto WasteDown(Cursor, GameState const& s) -> Cursor { return EnterTableau(1, s); }
        auto WasteLeft(Cursor, GameState const&) -> Cursor { return At(Zone::Stock); }
        auto WasteRight(Cursor, GameState const&) -> Cursor { return At(Zone::Foundation, 0); }

        auto FoundationDown(Cursor c, GameState const& s) -> Cursor
        {
            return EnterTableau(std::min<size_t>(5 + c.pile_index / 2, LastTableau), s);
        }

        auto FoundationLeft(Cursor c, GameState const&) -> Cursor
        {
            return c.pile_index > 0 ? At(Zone::Foundation, c.pile_index - 1) : At(Zone::Waste);
        }

        auto FoundationRight(Cursor c, GameState const&) -> Cursor
        {
            return c.pile_index < LastFoundation ? At(Zone::Foundation, c.pile_index + 1) : c;
        }

        auto ZoneAbove(size_t const pile) -> Cursor
        {
            if (pile == 0) return At(Zone::Stock);
            if (pile == 1) return At(Zone::Waste);
            // piles 2-4 sit under foundation 0, 5-6 under foundations 0-1
            return At(Zone::Foundation, pile <= 4 ? 0 : std::min<size_t>(pile - 5, LastFoundation));
        }

        auto TableauUp(Cursor c, GameState const& s) -> Cursor
        {
            if (c.card_index > FirstSelectableIndex(c, s))
            {
                --c.card_index;
                return c;
            }
            return ZoneAbove(c.pile_index);
        }

        auto TableauDown(Cursor c, GameState const& s) -> Cursor
        {
            Pile const& pile = s.tableau[c.pile_index];
            if (!pile.empty() && c.card_index + 1 < pile.size()) ++c.card_index;
            return c;
        }

        auto TableauLeft(Cursor c, GameState const& s) -> Cursor
        {
            return c.pile_index > 0 ? EnterTableau(c.pile_index - 1, s) : c;
        }

        auto TableauRight(Cursor c, GameState const& s) -> Cursor
        {
            return c.pile_index < LastTableau ? EnterTableau(c.pile_index + 1, s) : c;
        }

        // [zone][direction] with directions ordered Up, Down, Left, Right
        constexpr std::array<std::array<Rule, DirectionCount>, ZoneCount> Transitions{{
            /* Stock      */ {Stay,      StockDown,      Stay,           StockRight},
            /* Waste      */ {Stay,      WasteDown,      WasteLeft,      WasteRight},
            /* Foundation */ {Stay,      FoundationDown, FoundationLeft, FoundationRight},
            /* Tableau    */ {TableauUp, TableauDown,    TableauLeft,    TableauRight},
        }};

        static_assert(std::to_underlying(Zone::Stock) == 0 && std::to_underlying(Zone::Tableau) == 3);
        static_assert(std::to_underlying(Direction::Up) == 0 && std::to_underlying(Direction::Right) == 3);
    }

    auto Move(Cursor cursor, Direction const dir, GameState const& state) -> Cursor
    {
        cursor = Normalise(cursor);
        Rule const rule = Transitions[std::to_underlying(cursor.zone)][std::to_underlying(dir)];
        return rule(cursor, state);
    }

    auto FirstSelectableIndex(Cursor const& cursor, GameState const& state) -> size_t
    {
        if (cursor.zone != Zone::Tableau || cursor.pile_index >= constants::TableauCount) return 0;

        Pile const& pile = state.tableau[cursor.pile_index];
        auto const it = std::ranges::find_if(pile, [](Card const& c) { return c.face_up(); });
        return it == pile.end() ? 0 : static_cast<size_t>(std::distance(pile.begin(), it));
    }

    auto SnapToSelectable(Cursor cursor, GameState const& state) -> Cursor
    {
        cursor = Normalise(cursor);
        if (cursor.zone != Zone::Tableau) return cursor;

        if (state.tableau[cursor.pile_index].empty())
        {
            cursor.card_index = 0;
            return cursor;
        }
        cursor.card_index = std::max(cursor.card_index, FirstSelectableIndex(cursor, state));
        return cursor;
    }

    auto Clamp(Cursor cursor, GameState const& state) -> Cursor
    {
        cursor = Normalise(cursor);
        if (cursor.zone != Zone::Tableau) return cursor;

        Pile const& pile = state.tableau[cursor.pile_index];
        if (cursor.card_index >= pile.size())
            cursor.card_index = pile.empty() ? 0 : pile.size() - 1;
        return SnapToSelectable(cursor, state);
    }
}
