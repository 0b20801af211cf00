//
// Created by Malik T on 19/08/2025.
//

#ifndef KLONDIKE_INVARIANTS_HPP
#define KLONDIKE_INVARIANTS_HPP

#include <algorithm>
#include <format>
#include <ranges>

#include "../core/Exception.hpp"
#include "../core/Rules.hpp"
#include "../core/Session.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"

namespace klondike::core::debug
{
    // A second layer of checks over what the move executor already guarantees.
    // Throws AssertionError on the first broken rule.
    inline auto CheckInvariants(GameState const& s) -> void
    {
#if KLD_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        // 1) Conservation: every card exactly once
        KLD_ASSERT(util::HoldsFullDeck(s),
                   std::format("Card conservation broken ({} cards on the board)", util::TotalCards(s)));

        // 2) Foundation n holds Ace..n of its own suit
        for (size_t f{}; f < s.foundations.size(); ++f)
        {
            Pile const& pile = s.foundations[f];
            for (size_t i{}; i < pile.size(); ++i)
            {
                KLD_ASSERT(pile[i].face_up(), "Face-down card on a foundation");
                KLD_ASSERT(pile[i].suit() == rules::FoundationSuit(f), "Foundation holds a foreign suit");
                KLD_ASSERT(RankValue(pile[i].rank()) == static_cast<int>(i) + 1, "Foundation out of order");
            }
        }

        // 3) Tableau: face-down block then a valid run, top always revealed
        for (Pile const& pile : s.tableau)
        {
            if (pile.empty()) continue;
            KLD_ASSERT(pile.back().face_up(), "Tableau top left face-down");

            auto const first_up = std::ranges::find_if(pile, [](Card const& c) { return c.face_up(); });
            KLD_ASSERT(std::all_of(first_up, pile.end(), [](Card const& c) { return c.face_up(); }),
                       "Face-down card inside a face-up run");
            KLD_ASSERT(rules::IsMovableRun(pile, static_cast<size_t>(std::distance(pile.begin(), first_up))),
                       "Face-up tableau run breaks rank/colour alternation");
        }

        // 4) Stock hidden, waste shown
        KLD_ASSERT(std::ranges::none_of(s.stock, [](Card const& c) { return c.face_up(); }), "Face-up card in stock");
        KLD_ASSERT(std::ranges::all_of(s.waste, [](Card const& c) { return c.face_up(); }), "Face-down card in waste");
#endif // KLD_ENABLE_TEST_HOOKS == true
    }

    inline auto CheckInvariants(Session const& session) -> void
    {
#if KLD_ENABLE_TEST_HOOKS == false
        (void)session;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(session);
        CheckInvariants(*s.state);

        KLD_ASSERT(s.undo_depth <= s.undo_capacity, "Undo history exceeds its capacity");

        bool const complete = util::FoundationTotal(*s.state) == constants::DeckSize;
        KLD_ASSERT(complete == (s.status == SessionStatus::Won), "Won status disagrees with the foundations");

        if (s.cursor.zone == Zone::Foundation)
            KLD_ASSERT(s.cursor.pile_index < constants::FoundationCount, "Cursor past the last foundation");
        if (s.cursor.zone == Zone::Tableau)
        {
            KLD_ASSERT(s.cursor.pile_index < constants::TableauCount, "Cursor past the last tableau pile");
            Pile const& pile = s.state->tableau[s.cursor.pile_index];
            KLD_ASSERT(pile.empty() ? s.cursor.card_index == 0 : s.cursor.card_index < pile.size(),
                       "Cursor past the end of its pile");
        }

        // a selection always names a card that is still there and face-up
        if (s.selection)
        {
            std::optional<Card> const card = session.SelectedCard();
            KLD_ASSERT(card.has_value() && card->face_up(), "Selection points at no card");
        }

        // burials only grow while no progress is made
        if (s.consecutive_burials > 0)
        {
            KLD_ASSERT(s.draw_mode == DrawMode::Three, "Burial recorded outside draw-3");
            KLD_ASSERT(!s.made_progress, "Burials recorded alongside progress");
        }
#endif // KLD_ENABLE_TEST_HOOKS == true
    }
}

#endif //KLONDIKE_INVARIANTS_HPP
