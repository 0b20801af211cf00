//
// Created by Malik T on 18/08/2025.
//

#ifndef KLONDIKE_RANDOMPLAYER_HPP
#define KLONDIKE_RANDOMPLAYER_HPP

#include <optional>
#include <random>
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace klondike::core
{
    // Seeded stream of weighted random inputs. Never asks for a restart, so a game
    // only ends by winning or by the stall machine.
    class RandomPlayer final : public klondike::core::Player
    {
    public:
        explicit RandomPlayer(uint64_t rng_seed);

        auto NextAction(std::shared_ptr<SessionView const> view) -> Action override;
        auto DecideBury(std::shared_ptr<SessionView const> view) -> BuryDecision override;

    private:
        auto MoveToward(SessionView const& v) -> Action;

    private:
        std::mt19937 rng_;
        // Highlights vanish with the next dispatched action, so the destinations shown for
        // the current selection are kept here until that selection is gone.
        std::optional<Selection> planned_for_;
        std::optional<HighlightedDestinations> plan_;
    };
}

#endif //KLONDIKE_RANDOMPLAYER_HPP
