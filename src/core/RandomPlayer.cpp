//
// Created by Malik T on 18/08/2025.
//

#include "RandomPlayer.hpp"

#include <array>
#include <utility>

namespace klondike::core
{
    namespace
    {
        // Indexed by Action. Restart stays at zero.
        constexpr std::array<double, ActionCount> Weights{
            /* MoveUp      */ 8,
            /* MoveDown    */ 10,
            /* MoveLeft    */ 10,
            /* MoveRight   */ 10,
            /* Select      */ 16,
            /* Place       */ 0, // chosen through MoveToward instead
            /* Cancel      */ 2,
            /* StockAction */ 10,
            /* Undo        */ 1,
            /* Restart     */ 0,
            /* ShowHints   */ 6,
        };
        static_assert(std::to_underlying(Action::ShowHints) + 1 == ActionCount);
    }

    RandomPlayer::RandomPlayer(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomPlayer::NextAction(std::shared_ptr<SessionView const> view) -> Action
    {
        if (view->highlighted && view->selection)
        {
            plan_ = view->highlighted;
            planned_for_ = view->selection;
        }
        else if (view->selection != planned_for_)
        {
            plan_.reset();
            planned_for_.reset();
        }

        // with a card in hand, head for a destination some of the time
        if (view->selection && std::bernoulli_distribution{0.6}(rng_))
            return MoveToward(*view);

        std::discrete_distribution<size_t> pick(Weights.begin(), Weights.end());
        return static_cast<Action>(pick(rng_));
    }

    auto RandomPlayer::MoveToward(SessionView const& v) -> Action
    {
        // no hints yet: ask for them, the next view carries the highlights
        if (!plan_) return Action::ShowHints;

        HighlightedDestinations const& h = *plan_;
        Cursor const& c = v.cursor;

        if (!h.foundation_piles.empty())
        {
            size_t const target = h.foundation_piles.front();
            if (c.zone == Zone::Foundation && c.pile_index == target) return Action::Place;
            if (c.zone == Zone::Tableau) return Action::MoveUp;
            if (c.zone == Zone::Foundation && c.pile_index > target) return Action::MoveLeft;
            return Action::MoveRight;
        }

        size_t const target = h.tableau_piles.front();
        if (c.zone == Zone::Tableau)
        {
            if (c.pile_index == target) return Action::Place;
            return c.pile_index < target ? Action::MoveRight : Action::MoveLeft;
        }
        return Action::MoveDown;
    }

    auto RandomPlayer::DecideBury(std::shared_ptr<SessionView const> view) -> BuryDecision
    {
        (void)view;
        return std::bernoulli_distribution{0.75}(rng_) ? BuryDecision::Bury : BuryDecision::Decline;
    }
}
