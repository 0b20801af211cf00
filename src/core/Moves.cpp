//
// Created by Malik T on 16/08/2025.
//

#include "Moves.hpp"

#include <algorithm>
#include <iterator>
#include "Rules.hpp"

namespace
{
    using klondike::core::error::RuleViolationCode;
    using klondike::core::error::Viol;
    using klondike::core::Zone;

    inline auto Fail(klondike::core::error::RuleViolation v) -> klondike::core::MoveResult
    {
        return std::unexpected(std::move(v));
    }

    inline auto TableauInRange(size_t const idx) -> bool
    {
        return idx < klondike::core::constants::TableauCount;
    }

    inline auto FoundationInRange(size_t const idx) -> bool
    {
        return idx < klondike::core::constants::FoundationCount;
    }
}

namespace klondike::core::moves
{
    using RVC = error::RuleViolationCode;

    auto RevealTop(Pile& pile) -> bool
    {
        if (pile.empty() || pile.back().face_up()) return false;
        pile.back() = pile.back().FaceUp();
        return true;
    }

    auto MoveTableauToTableau(GameState& state, size_t const src_pile, size_t const card_index,
                              size_t const dest_pile) -> MoveResult
    {
        if (!TableauInRange(src_pile))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Tableau).with_source(src_pile));
        if (!TableauInRange(dest_pile))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Tableau).with_destination(dest_pile));
        if (src_pile == dest_pile)
            return Fail(Viol(RVC::Pile_SameSourceAndDestination).with_source(src_pile).with_destination(dest_pile));

        Pile& src = state.tableau[src_pile];
        Pile& dest = state.tableau[dest_pile];

        if (!rules::CanPickFromTableau(src, card_index))
            return Fail(Viol(RVC::Tableau_CannotPick).with_source(src_pile).with_card_index(card_index));

        if (!rules::CanPlaceOnTableau(src[card_index], dest))
            return Fail(Viol(RVC::Tableau_CannotPlace)
                        .with_source(src_pile).with_destination(dest_pile).with_card_index(card_index));

        auto const first = src.begin() + static_cast<std::ptrdiff_t>(card_index);
        dest.insert(dest.end(), first, src.end());
        src.erase(first, src.end());

        RevealTop(src);
        return {};
    }

    auto MoveWasteToTableau(GameState& state, size_t const dest_pile) -> MoveResult
    {
        if (!TableauInRange(dest_pile))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Tableau).with_destination(dest_pile));
        if (!rules::CanPickFromWaste(state))
            return Fail(Viol(RVC::Waste_Empty).with_zone(Zone::Waste));

        Card const card = state.waste.back();
        if (!rules::CanPlaceOnTableau(card, state.tableau[dest_pile]))
            return Fail(Viol(RVC::Tableau_CannotPlace).with_zone(Zone::Waste).with_destination(dest_pile));

        state.waste.pop_back();
        state.tableau[dest_pile].push_back(card);
        return {};
    }

    auto MoveWasteToFoundation(GameState& state, size_t const dest_foundation) -> MoveResult
    {
        if (!FoundationInRange(dest_foundation))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Foundation).with_destination(dest_foundation));
        if (!rules::CanPickFromWaste(state))
            return Fail(Viol(RVC::Waste_Empty).with_zone(Zone::Waste));

        Card const card = state.waste.back();
        if (!rules::CanPlaceOnFoundation(card, state.foundations[dest_foundation],
                                         rules::FoundationSuit(dest_foundation)))
            return Fail(Viol(RVC::Foundation_CannotPlace).with_zone(Zone::Waste).with_destination(dest_foundation));

        state.waste.pop_back();
        state.foundations[dest_foundation].push_back(card);
        return {};
    }

    auto MoveTableauToFoundation(GameState& state, size_t const src_pile, size_t const dest_foundation,
                                 std::optional<size_t> const card_index) -> MoveResult
    {
        if (!TableauInRange(src_pile))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Tableau).with_source(src_pile));
        if (!FoundationInRange(dest_foundation))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Foundation).with_destination(dest_foundation));

        Pile& src = state.tableau[src_pile];
        if (src.empty())
            return Fail(Viol(RVC::Tableau_Empty).with_source(src_pile));

        if (card_index && *card_index + 1 != src.size())
            return Fail(Viol(RVC::Foundation_SingleCardOnly)
                        .with_source(src_pile).with_card_index(*card_index)
                        .with_count(src.size() > *card_index ? src.size() - *card_index : 0));

        Card const card = src.back();
        if (!card.face_up())
            return Fail(Viol(RVC::Tableau_TopFaceDown).with_source(src_pile));

        if (!rules::CanPlaceOnFoundation(card, state.foundations[dest_foundation],
                                         rules::FoundationSuit(dest_foundation)))
            return Fail(Viol(RVC::Foundation_CannotPlace).with_source(src_pile).with_destination(dest_foundation));

        src.pop_back();
        state.foundations[dest_foundation].push_back(card);

        RevealTop(src);
        return {};
    }

    auto MoveFoundationToTableau(GameState& state, size_t const src_foundation, size_t const dest_pile) -> MoveResult
    {
        if (!FoundationInRange(src_foundation))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Foundation).with_source(src_foundation));
        if (!TableauInRange(dest_pile))
            return Fail(Viol(RVC::Pile_IndexOutOfRange).with_zone(Zone::Tableau).with_destination(dest_pile));

        Pile& src = state.foundations[src_foundation];
        if (src.empty())
            return Fail(Viol(RVC::Foundation_Empty).with_source(src_foundation));

        Card const card = src.back();
        if (!rules::CanPlaceOnTableau(card, state.tableau[dest_pile]))
            return Fail(Viol(RVC::Foundation_CannotPlaceOnTableau)
                        .with_source(src_foundation).with_destination(dest_pile));

        src.pop_back();
        state.tableau[dest_pile].push_back(card);
        return {};
    }

    auto DrawFromStock(GameState& state, size_t const draw_count) -> MoveResult
    {
        if (draw_count == 0)
            return Fail(Viol(RVC::Draw_ZeroCount).with_count(draw_count));
        if (!rules::CanDrawFromStock(state))
            return Fail(Viol(RVC::Stock_Empty).with_zone(Zone::Stock));

        size_t const n = std::min(draw_count, state.stock.size());
        for (size_t i{}; i < n; ++i)
        {
            state.waste.push_back(state.stock.back().FaceUp());
            state.stock.pop_back();
        }
        return {};
    }

    auto RecycleWasteToStock(GameState& state) -> MoveResult
    {
        if (!state.stock.empty())
            return Fail(Viol(RVC::Stock_NotEmpty).with_zone(Zone::Stock).with_count(state.stock.size()));
        if (state.waste.empty())
            return Fail(Viol(RVC::Waste_Empty).with_zone(Zone::Waste));

        // taking from the waste top reverses the pass: the first card drawn is the next stock top again
        state.stock.reserve(state.waste.size());
        while (!state.waste.empty())
        {
            state.stock.push_back(state.waste.back().FaceDown());
            state.waste.pop_back();
        }
        return {};
    }

    auto BuryTopOfStock(GameState& state) -> MoveResult
    {
        if (state.stock.empty())
            return Fail(Viol(RVC::Stock_Empty).with_zone(Zone::Stock));

        std::ranges::rotate(state.stock, std::prev(state.stock.end()));
        return {};
    }
}
