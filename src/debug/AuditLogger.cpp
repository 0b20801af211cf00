#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <utility>

#include "../core/Format.hpp"
#include "../core/Util.hpp"

using namespace klondike::core;

namespace
{

auto s_pile(Pile const& pile) -> std::string
{
    std::string body;
    for (size_t i{}; i < pile.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("{}", pile[i]);
    }
    return body;
}

auto s_top(Pile const& pile) -> std::string
{
    return pile.empty() ? std::string("--") : std::format("{}", pile.back());
}

auto s_cursor(Cursor const& c) -> std::string
{
    if (c.zone == Zone::Tableau) return std::format("{}[{}:{}]", to_string(c.zone), c.pile_index, c.card_index);
    if (c.zone == Zone::Foundation) return std::format("{}[{}]", to_string(c.zone), c.pile_index);
    return std::string(to_string(c.zone));
}

auto serialize_board(GameState const& s) -> std::string
{
    std::string serial = std::format("stock={} waste={} found=[", s.stock.size(), s_top(s.waste));
    for (size_t i{}; i < s.foundations.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += s_top(s.foundations[i]);
    }
    serial += "] tab=[";
    for (size_t i{}; i < s.tableau.size(); ++i)
    {
        serial += (i ? " | " : "");
        serial += s_pile(s.tableau[i]);
    }
    serial += "]";
    return serial;
}

} // anonymous namespace

namespace klondike::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Session const& session) -> void
{
    out_ << std::format("Seed={}\n", session.DealSeed());
    out_ << std::format("Mode={}\n", to_string(session.Mode()));
    out_ << std::format("Deal: {}\n", serialize_board(session.State()));
    out_.flush();
}

auto AuditLogger::turn(SessionView const& view, Action const a) -> void
{
    out_ << std::format(
        "Turn moves={} cursor={} selected={} board: {}\n",
        view.move_count,
        s_cursor(view.cursor),
        view.selection ? "yes" : "no",
        serialize_board(view.state)
    );

    out_ << std::format("Action: {}\n", to_string(a));
}

auto AuditLogger::outcome(MoveOutcome const m, std::string const& message) -> void
{
    out_ << std::format("Outcome: {} \"{}\"\n", to_string(m), message);
}

auto AuditLogger::bury(BuryDecision const d) -> void
{
    out_ << std::format("Bury: {}\n", d == BuryDecision::Bury ? "accepted" : "declined");
}

auto AuditLogger::end(Session const& session) -> void
{
    out_ << std::format("End status={} moves={} home={}\n",
                        to_string(session.Status()),
                        session.MoveCount(),
                        util::FoundationTotal(session.State()));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace klondike::core::debug
