//
// Created by Malik T on 15/08/2025.
//

#ifndef KLONDIKE_DRAWRULES_HPP
#define KLONDIKE_DRAWRULES_HPP

#include <memory>
#include "Actions.hpp"
#include "Types.hpp"

namespace klondike::core
{
    // What differs between draw-1 and draw-3: how many cards a draw turns over
    // and what happens when a whole stock pass produced no move.
    class DrawRules
    {
    public:
        virtual ~DrawRules() = default;

        [[nodiscard]] virtual auto Mode() const noexcept -> DrawMode = 0;
        [[nodiscard]] virtual auto DrawCount() const noexcept -> size_t = 0;

        // Asked only at the recycle point (stock empty, waste not empty).
        [[nodiscard]] virtual auto OnPassExhausted(bool made_progress_since_last_recycle,
                                                   uint32_t consecutive_burials) const -> StallVerdict = 0;
    };

    class DrawOneRules final : public DrawRules
    {
    public:
        auto Mode() const noexcept -> DrawMode override { return DrawMode::One; }
        auto DrawCount() const noexcept -> size_t override { return 1; }
        auto OnPassExhausted(bool made_progress_since_last_recycle,
                             uint32_t consecutive_burials) const -> StallVerdict override;
    };

    class DrawThreeRules final : public DrawRules
    {
    public:
        auto Mode() const noexcept -> DrawMode override { return DrawMode::Three; }
        auto DrawCount() const noexcept -> size_t override { return 3; }
        auto OnPassExhausted(bool made_progress_since_last_recycle,
                             uint32_t consecutive_burials) const -> StallVerdict override;
    };

    auto MakeDrawRules(DrawMode mode) -> std::unique_ptr<DrawRules>;
}

#endif //KLONDIKE_DRAWRULES_HPP
