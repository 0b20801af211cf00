//
// Created by Malik T on 14/08/2025.
//

#ifndef KLONDIKE_ACTIONS_HPP
#define KLONDIKE_ACTIONS_HPP

#include "Types.hpp"

namespace klondike::core
{
    // Abstract input, already decoded from keys/mouse by the front end
    enum class Action : uint8_t
    {
        MoveUp,
        MoveDown,
        MoveLeft,
        MoveRight,
        Select,
        Place,
        Cancel,
        StockAction,
        Undo,
        Restart,
        ShowHints
    };
    inline constexpr size_t ActionCount = 11;

    enum class BuryDecision : uint8_t
    {
        Bury,
        Decline
    };

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        Won,
        Lost
    };

    // What the draw-mode rules decide when a stock pass has been exhausted
    enum class StallVerdict : uint8_t
    {
        Recycle,
        OfferBury,
        Lost
    };
} // namespace klondike::core

#endif //KLONDIKE_ACTIONS_HPP
