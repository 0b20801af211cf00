//
// Created by Malik T on 19/08/2025.
//

#ifndef KLONDIKE_FORMAT_HPP
#define KLONDIKE_FORMAT_HPP

#include <format>
#include <string>
#include <string_view>
#include "Actions.hpp"
#include "State.hpp"

namespace klondike::core
{
    inline auto to_string(Suit const s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Hearts: return "♥";
        case Suit::Diamonds: return "♦";
        case Suit::Clubs: return "♣";
        case Suit::Spades: return "♠";
        }
        return "?";
    }

    inline auto to_string(Rank const r) -> std::string_view
    {
        switch (r)
        {
        case Rank::Ace: return "A";
        case Rank::Two: return "2";
        case Rank::Three: return "3";
        case Rank::Four: return "4";
        case Rank::Five: return "5";
        case Rank::Six: return "6";
        case Rank::Seven: return "7";
        case Rank::Eight: return "8";
        case Rank::Nine: return "9";
        case Rank::Ten: return "10";
        case Rank::Jack: return "J";
        case Rank::Queen: return "Q";
        case Rank::King: return "K";
        }
        return "?";
    }

    inline auto to_string(Zone const z) -> std::string_view
    {
        switch (z)
        {
        case Zone::Stock: return "stock";
        case Zone::Waste: return "waste";
        case Zone::Foundation: return "foundation";
        case Zone::Tableau: return "tableau";
        }
        return "?";
    }

    inline auto to_string(Action const a) -> std::string_view
    {
        switch (a)
        {
        case Action::MoveUp: return "MoveUp";
        case Action::MoveDown: return "MoveDown";
        case Action::MoveLeft: return "MoveLeft";
        case Action::MoveRight: return "MoveRight";
        case Action::Select: return "Select";
        case Action::Place: return "Place";
        case Action::Cancel: return "Cancel";
        case Action::StockAction: return "StockAction";
        case Action::Undo: return "Undo";
        case Action::Restart: return "Restart";
        case Action::ShowHints: return "ShowHints";
        }
        return "?";
    }

    inline auto to_string(MoveOutcome const o) -> std::string_view
    {
        switch (o)
        {
        case MoveOutcome::Invalid: return "Invalid";
        case MoveOutcome::Applied: return "Applied";
        case MoveOutcome::Won: return "Won";
        case MoveOutcome::Lost: return "Lost";
        }
        return "?";
    }

    inline auto to_string(SessionStatus const s) -> std::string_view
    {
        switch (s)
        {
        case SessionStatus::Playing: return "Playing";
        case SessionStatus::Won: return "Won";
        case SessionStatus::Lost: return "Lost";
        }
        return "?";
    }

    inline auto to_string(DrawMode const m) -> std::string_view
    {
        switch (m)
        {
        case DrawMode::One: return "draw-1";
        case DrawMode::Three: return "draw-3";
        }
        return "?";
    }
}

// "K♠", "10♥"; face-down cards render as "##"
template <>
struct std::formatter<klondike::core::Card> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(klondike::core::Card const& c, FormatContext& ctx) const
    {
        if (!c.face_up()) return std::formatter<std::string_view>::format("##", ctx);
        std::string const s = std::format("{}{}", klondike::core::to_string(c.rank()),
                                          klondike::core::to_string(c.suit()));
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //KLONDIKE_FORMAT_HPP
