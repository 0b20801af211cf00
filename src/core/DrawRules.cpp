//
// Created by Malik T on 15/08/2025.
//

#include "DrawRules.hpp"

#include "Exception.hpp"

namespace klondike::core
{
    auto DrawOneRules::OnPassExhausted(bool const made_progress_since_last_recycle,
                                       uint32_t const consecutive_burials) const -> StallVerdict
    {
        (void)consecutive_burials;
        // draw-1 has no recovery: a pass without progress will repeat forever
        return made_progress_since_last_recycle ? StallVerdict::Recycle : StallVerdict::Lost;
    }

    auto DrawThreeRules::OnPassExhausted(bool const made_progress_since_last_recycle,
                                         uint32_t const consecutive_burials) const -> StallVerdict
    {
        if (made_progress_since_last_recycle) return StallVerdict::Recycle;
        if (consecutive_burials >= constants::MaxConsecutiveBurials) return StallVerdict::Lost;
        return StallVerdict::OfferBury;
    }

    auto MakeDrawRules(DrawMode const mode) -> std::unique_ptr<DrawRules>
    {
        switch (mode)
        {
        case DrawMode::One: return std::make_unique<DrawOneRules>();
        case DrawMode::Three: return std::make_unique<DrawThreeRules>();
        }
        KLD_THROW(error::Code::Config, "Draw mode must be 1 or 3");
    }
}
