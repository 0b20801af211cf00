//
// Created by Malik T on 02/09/2025.
//

#ifndef KLONDIKE_SESSIONRECORD_HPP
#define KLONDIKE_SESSIONRECORD_HPP

#include <expected>
#include <string>
#include "State.hpp"

namespace klondike::core
{
    // Plain persistence record. Storage and slot management live outside the engine.
    // The stall fields are optional because records written before they existed lack them.
    struct SessionRecord
    {
        GameState state;
        uint32_t move_count{};
        std::chrono::milliseconds elapsed{};
        DrawMode draw_mode{DrawMode::One};
        std::optional<bool> made_progress_since_last_recycle;
        std::optional<uint32_t> consecutive_burials;

        friend auto operator==(SessionRecord const&, SessionRecord const&) -> bool = default;
    };

    // A record after migration: every field present.
    struct ResumePoint
    {
        GameState state;
        uint32_t move_count{};
        std::chrono::milliseconds elapsed{};
        DrawMode draw_mode{DrawMode::One};
        bool made_progress_since_last_recycle{true};
        uint32_t consecutive_burials{0};
    };

    struct RecordError
    {
        std::string message;
    };

    // Missing stall fields default in the player's favour (no progress history means no
    // false loss on resume, and the full bury allowance). Burials are dropped when the record
    // is not draw-3 or shows progress, since neither can carry a stall.
    auto Migrate(SessionRecord record) -> ResumePoint;

    // Well-formed cards, 52 distinct cards, foundations built Ace-up in their own suit, face-down stock, face-up waste.
    auto ValidateLayout(GameState const& state) -> std::expected<void, RecordError>;

    // Draw mode must be 1 or 3, then the layout rules above.
    auto ValidateRecord(ResumePoint const& resume) -> std::expected<void, RecordError>;
}

#endif //KLONDIKE_SESSIONRECORD_HPP
