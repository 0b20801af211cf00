//
// Created by Malik T on 14/08/2025.
//

#ifndef KLONDIKE_PLAYER_HPP
#define KLONDIKE_PLAYER_HPP

#include <memory>
#include "Actions.hpp"
#include "State.hpp"

namespace klondike::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by Session::Step for the next abstract input (UI adapter, script or bot).
        virtual auto NextAction(std::shared_ptr<SessionView const> view) -> Action = 0;

        // Synchronous: the session does not continue past the draw-3 recovery point until this returns.
        virtual auto DecideBury(std::shared_ptr<SessionView const> view) -> BuryDecision = 0;
    };
}
#endif //KLONDIKE_PLAYER_HPP
