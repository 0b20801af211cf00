//
// Created by Malik T on 14/08/2025.
//

#ifndef KLONDIKE_EXCEPTION_HPP
#define KLONDIKE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "State.hpp"

namespace klondike::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a player's illegal move)
        State, // session/state misuse (not a player's illegal move)
        InvalidAction, // action that the engine was never meant to receive
        Serialization, // FlatBuffers verification/build errors
        Config, // rejected configuration
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define KLD_THROW(code_enum, msg) ::klondike::core::error::fail((code_enum), (msg))
#define KLD_ASSERT(cond, msg) do { if(!(cond)) ::klondike::core::error::fail(::klondike::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by where they are raised.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        Session_GameOver,
        Pile_IndexOutOfRange,
        Pile_SameSourceAndDestination,

        // Selection protocol
        Select_WasteEmpty,
        Select_FoundationEmpty,
        Select_TableauEmpty,
        Select_FaceDown,
        Place_NothingSelected,
        Place_OnStock,
        Place_OnWaste,
        Place_RunToFoundation,
        Place_FoundationToFoundation,
        Hints_NoCard,
        Hints_NoDestinations,
        Undo_Empty,
        Stock_BothEmpty,

        // Tableau
        Tableau_CannotPick,
        Tableau_CannotPlace,
        Tableau_Empty,
        Tableau_TopFaceDown,

        // Waste
        Waste_Empty,

        // Foundation
        Foundation_CannotPlace,
        Foundation_SingleCardOnly,
        Foundation_Empty,
        Foundation_CannotPlaceOnTableau,

        // Stock
        Stock_Empty,
        Stock_NotEmpty,
        Draw_ZeroCount
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Zone> zone{};
        std::optional<size_t> source{};
        std::optional<size_t> destination{};
        std::optional<size_t> card_index{};
        std::optional<size_t> count{};

        auto with_zone(Zone z) -> RuleViolation&
        {
            zone = z;
            return *this;
        }

        auto with_source(size_t s) -> RuleViolation&
        {
            source = s;
            return *this;
        }

        auto with_destination(size_t d) -> RuleViolation&
        {
            destination = d;
            return *this;
        }

        auto with_card_index(size_t i) -> RuleViolation&
        {
            card_index = i;
            return *this;
        }

        auto with_count(size_t n) -> RuleViolation&
        {
            count = n;
            return *this;
        }
    };

    inline auto Viol(RuleViolationCode const code) -> RuleViolation
    {
        return RuleViolation{.code = code};
    }

    // Short, player-facing text. Renderers display it verbatim.
    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Session_GameOver: return "Game over. Restart to play again.";
        case E::Pile_IndexOutOfRange: return "No such pile";
        case E::Pile_SameSourceAndDestination: return "Source and destination are the same pile";

        case E::Select_WasteEmpty: return "Waste is empty!";
        case E::Select_FoundationEmpty: return "Foundation is empty!";
        case E::Select_TableauEmpty: return "Tableau pile is empty!";
        case E::Select_FaceDown: return "Cannot select face-down card!";
        case E::Place_NothingSelected: return "Nothing selected!";
        case E::Place_OnStock: return "Cannot place cards on stock!";
        case E::Place_OnWaste: return "Cannot place cards on waste!";
        case E::Place_RunToFoundation: return "Can only move single card to foundation!";
        case E::Place_FoundationToFoundation: return "Cannot move foundation to foundation!";
        case E::Hints_NoCard: return "No card to show placements for!";
        case E::Hints_NoDestinations: return "No valid placements for this card!";
        case E::Undo_Empty: return "Nothing to undo!";
        case E::Stock_BothEmpty: return "Both stock and waste are empty!";

        case E::Tableau_CannotPick: return "Cannot pick from that position";
        case E::Tableau_CannotPlace: return "Cannot place there";
        case E::Tableau_Empty: return "Tableau pile is empty";
        case E::Tableau_TopFaceDown: return "Cannot move face-down card";

        case E::Waste_Empty: return "Waste is empty";

        case E::Foundation_CannotPlace: return "Cannot place on foundation";
        case E::Foundation_SingleCardOnly: return "Only a single card can move to a foundation";
        case E::Foundation_Empty: return "Foundation is empty";
        case E::Foundation_CannotPlaceOnTableau: return "Cannot place on tableau";

        case E::Stock_Empty: return "Stock is empty";
        case E::Stock_NotEmpty: return "Stock is not empty";
        case E::Draw_ZeroCount: return "Draw count must be positive";
        }
        return "Unknown";
    }

    inline auto zone_tag(Zone const z) -> std::string_view
    {
        switch (z)
        {
        case Zone::Stock: return "S";
        case Zone::Waste: return "W";
        case Zone::Foundation: return "F";
        case Zone::Tableau: return "T";
        }
        return "?";
    }

    inline auto message(RuleViolation const& v) -> std::string
    {
        return std::string(to_string(v.code));
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.zone) s += std::format(" | zone={}", zone_tag(*v.zone));
        if (v.source) s += std::format(" | src={}", *v.source);
        if (v.destination) s += std::format(" | dest={}", *v.destination);
        if (v.card_index) s += std::format(" | card={}", *v.card_index);
        if (v.count) s += std::format(" | count={}", *v.count);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

namespace klondike::core
{
    using MoveResult = error::ValidateResult;
}

#endif //KLONDIKE_EXCEPTION_HPP
