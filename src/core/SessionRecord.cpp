//
// Created by Malik T on 02/09/2025.
//

#include "SessionRecord.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <utility>
#include "Rules.hpp"
#include "Util.hpp"

namespace klondike::core
{
    auto Migrate(SessionRecord record) -> ResumePoint
    {
        ResumePoint resume{
            .state = std::move(record.state),
            .move_count = record.move_count,
            .elapsed = std::max(record.elapsed, std::chrono::milliseconds{0}),
            .draw_mode = record.draw_mode,
            .made_progress_since_last_recycle = record.made_progress_since_last_recycle.value_or(true),
            .consecutive_burials = record.consecutive_burials.value_or(0),
        };
        // burials only count down a draw-3 stall that is still going
        if (resume.draw_mode != DrawMode::Three || resume.made_progress_since_last_recycle)
            resume.consecutive_burials = 0;
        return resume;
    }

    auto ValidateLayout(GameState const& state) -> std::expected<void, RecordError>
    {
        std::optional<Card> malformed;
        util::ForEachPile(state, [&malformed](Pile const& p)
        {
            if (malformed) return;
            if (auto const it = std::ranges::find_if_not(p, IsWellFormed); it != p.end()) malformed = *it;
        });
        if (malformed)
            return std::unexpected(RecordError{std::format("Record holds an impossible card (rank {}, suit {})",
                                                           RankValue(malformed->rank()),
                                                           std::to_underlying(malformed->suit()))});

        if (!util::HoldsFullDeck(state))
            return std::unexpected(RecordError{
                std::format("Record does not hold each of the 52 cards exactly once ({} cards)",
                            util::TotalCards(state))});

        for (size_t f{}; f < state.foundations.size(); ++f)
        {
            Pile const& pile = state.foundations[f];
            Suit const suit = rules::FoundationSuit(f);
            for (size_t i{}; i < pile.size(); ++i)
            {
                if (pile[i].suit() != suit || RankValue(pile[i].rank()) != static_cast<int>(i) + 1)
                    return std::unexpected(RecordError{std::format("Foundation {} is out of order at {}", f, i)});
            }
        }

        if (std::ranges::any_of(state.stock, [](Card const& c) { return c.face_up(); }))
            return std::unexpected(RecordError{"Stock holds a face-up card"});
        if (std::ranges::any_of(state.waste, [](Card const& c) { return !c.face_up(); }))
            return std::unexpected(RecordError{"Waste holds a face-down card"});

        return {};
    }

    auto ValidateRecord(ResumePoint const& resume) -> std::expected<void, RecordError>
    {
        if (!DrawModeFromCount(std::to_underlying(resume.draw_mode)))
            return std::unexpected(RecordError{
                std::format("Record has draw mode {}, expected 1 or 3", std::to_underlying(resume.draw_mode))});
        return ValidateLayout(resume.state);
    }
}
