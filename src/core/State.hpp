//
// Created by Malik T on 14/08/2025.
//

#ifndef KLONDIKE_STATE_HPP
#define KLONDIKE_STATE_HPP

#include <string>
#include "Types.hpp"

namespace klondike::core
{
    // Authoritative card layout. Back of each pile is its top.
    struct GameState
    {
        Pile stock;
        Pile waste;
        std::array<Pile, constants::FoundationCount> foundations{};
        std::array<Pile, constants::TableauCount> tableau{};

        friend auto operator==(GameState const&, GameState const&) -> bool = default;
    };

    enum class Zone : uint8_t
    {
        Stock = 0,
        Waste,
        Foundation,
        Tableau
    };
    inline constexpr size_t ZoneCount = 4;

    enum class Direction : uint8_t
    {
        Up = 0,
        Down,
        Left,
        Right
    };
    inline constexpr size_t DirectionCount = 4;

    struct Cursor
    {
        Zone   zone{Zone::Stock};
        size_t pile_index{0};
        // tableau only: where within the pile the focus rests
        size_t card_index{0};

        friend auto operator==(Cursor const&, Cursor const&) -> bool = default;
    };

    struct Selection
    {
        Zone   zone{Zone::Waste};
        size_t pile_index{0};
        // tableau only: base card of the selected run
        size_t card_index{0};

        friend auto operator==(Selection const&, Selection const&) -> bool = default;
    };

    struct HighlightedDestinations
    {
        std::vector<size_t> tableau_piles;
        std::vector<size_t> foundation_piles;

        [[nodiscard]] auto HasAny() const noexcept -> bool
        {
            return !tableau_piles.empty() || !foundation_piles.empty();
        }
        [[nodiscard]] auto Count() const noexcept -> size_t
        {
            return tableau_piles.size() + foundation_piles.size();
        }

        friend auto operator==(HighlightedDestinations const&, HighlightedDestinations const&) -> bool = default;
    };

    enum class SessionStatus : uint8_t
    {
        Playing,
        Won,
        Lost
    };

    // Read-only copy handed to renderers and players
    struct SessionView
    {
        GameState state;
        Cursor cursor;
        std::optional<Selection> selection;
        std::optional<HighlightedDestinations> highlighted;

        std::string message;
        uint32_t move_count{};
        std::chrono::milliseconds elapsed{};
        SessionStatus status{SessionStatus::Playing};
        DrawMode draw_mode{DrawMode::One};

        bool made_progress_since_last_recycle{true};
        uint32_t consecutive_burials{0};
        bool can_undo{false};
    };

} // namespace klondike::core

#endif //KLONDIKE_STATE_HPP
