//
// Created by Malik T on 20/08/2025.
//

#ifndef KLONDIKE_AUDITLOGGER_HPP
#define KLONDIKE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Actions.hpp"
#include "../core/Session.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace klondike::core::debug
{
    // Plain-text transcript of one or more games, one line per event.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]] auto is_open() const -> bool { return out_.is_open(); }

        // Game header (seed, draw mode, dealt board)
        auto start(Session const& session) -> void;

        // Per step, before dispatch: the board the player saw and the action it chose
        auto turn(SessionView const& view, Action a) -> void;

        // Per step, after dispatch
        auto outcome(MoveOutcome m, std::string const& message) -> void;

        auto bury(BuryDecision d) -> void;

        // Footer: status, move count, cards home
        auto end(Session const& session) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //KLONDIKE_AUDITLOGGER_HPP
