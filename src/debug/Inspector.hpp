//
// Created by Malik T on 19/08/2025.
//

#ifndef KLONDIKE_INSPECTOR_HPP
#define KLONDIKE_INSPECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

#include "../core/Session.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace klondike::core::debug
{
    // Read access to Session internals that the public surface does not expose.
    struct Inspector
    {
        struct SnapshotAll
        {
            GameState const* state{};
            Cursor cursor{};
            std::optional<Selection> selection;
            SessionStatus status{};

            size_t undo_depth{};
            size_t undo_capacity{};
            uint32_t move_count{};
            bool made_progress{};
            uint32_t consecutive_burials{};
            DrawMode draw_mode{};
        };

        static inline auto Gather(Session const& s) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.state = &s.state_;
            ret.cursor = s.cursor_;
            ret.selection = s.selection_;
            ret.status = s.status_;
            ret.undo_depth = s.undo_.Size();
            ret.undo_capacity = s.undo_.Capacity();
            ret.move_count = s.move_count_;
            ret.made_progress = s.made_progress_;
            ret.consecutive_burials = s.consecutive_burials_;
            ret.draw_mode = s.draw_rules_->Mode();
            return ret;
        }
    };
}

#endif //KLONDIKE_INSPECTOR_HPP
