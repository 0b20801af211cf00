//
// Created by Malik T on 20/08/2025.
//

#ifndef KLONDIKE_SESSION_HPP
#define KLONDIKE_SESSION_HPP

#include <expected>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include "Actions.hpp"
#include "DrawRules.hpp"
#include "Exception.hpp"
#include "Player.hpp"
#include "SessionRecord.hpp"
#include "State.hpp"
#include "Timer.hpp"
#include "Types.hpp"
#include "UndoStack.hpp"

namespace klondike::core::debug {struct Inspector;}

namespace klondike::core
{
    // One game of Klondike: owns the layout, the cursor/selection protocol, undo history
    // and the stall machine. Every player-facing failure is reported through Message().
    class Session
    {
    public:
        Session() = delete;
        Session(Config const& config, std::unique_ptr<Player> player);

        // Asks the player for one action and dispatches it.
        auto Step() -> MoveOutcome;
        // Highlights are cleared at the start of every dispatched action.
        auto Dispatch(Action action) -> MoveOutcome;

        auto MoveCursor(Direction dir) -> MoveOutcome;
        // On the stock this is the stock action.
        auto Select() -> MoveOutcome;
        auto Place() -> MoveOutcome;
        auto Cancel() -> void;
        auto StockAction() -> MoveOutcome;
        auto Undo() -> bool;
        // Fresh deal. Without a seed the next one comes from the session's own generator.
        auto Restart(std::optional<uint64_t> seed = std::nullopt) -> void;

        auto ComputeValidDestinations() -> std::optional<HighlightedDestinations>;
        [[nodiscard]] auto CheckWin() const -> bool;

        [[nodiscard]] auto SelectedCard() const -> std::optional<Card>;
        [[nodiscard]] auto CardUnderCursor() const -> std::optional<Card>;
        // "K♠ + 2 more"; empty when nothing is selected
        [[nodiscard]] auto DescribeSelection() const -> std::string;

        auto Snapshot() const -> std::shared_ptr<SessionView const>;
        [[nodiscard]] auto ToRecord() const -> SessionRecord;
        // Replaces the session wholesale; a rejected record leaves it untouched.
        auto Load(SessionRecord const& record) -> std::expected<void, RecordError>;

        auto Start() -> void { timer_.Start(); }
        auto Pause() -> void { timer_.Pause(); }
        auto Resume() -> void { timer_.Resume(); }
        [[nodiscard]] auto Elapsed() const -> std::chrono::milliseconds { return timer_.Elapsed(); }

        auto State() const noexcept -> GameState const& { return state_; }
        auto CursorNow() const noexcept -> Cursor { return cursor_; }
        auto CurrentSelection() const noexcept -> std::optional<Selection> const& { return selection_; }
        auto Highlighted() const noexcept -> std::optional<HighlightedDestinations> const& { return highlighted_; }
        auto Message() const noexcept -> std::string const& { return message_; }
        auto MoveCount() const noexcept -> uint32_t { return move_count_; }
        auto Status() const noexcept -> SessionStatus { return status_; }
        auto Mode() const noexcept -> DrawMode { return draw_rules_->Mode(); }
        auto MadeProgressSinceLastRecycle() const noexcept -> bool { return made_progress_; }
        auto ConsecutiveBurials() const noexcept -> uint32_t { return consecutive_burials_; }
        auto CanUndo() const noexcept -> bool { return undo_.CanUndo(); }
        auto DealSeed() const noexcept -> uint64_t { return deal_seed_; }
        auto PlayerPtr() noexcept -> Player* { return player_.get(); }

        friend struct debug::Inspector;

    private:
        auto IsOver() -> bool;
        auto Reject(error::RuleViolationCode code) -> MoveOutcome;

        auto MoveToFoundation(Selection const& sel, size_t dest) -> MoveOutcome;
        auto MoveToTableau(Selection const& sel, size_t dest) -> MoveOutcome;
        // Pops the speculative undo entry on failure, records the move on success.
        auto Resolve(MoveResult const& result, std::string_view success_message) -> MoveOutcome;

        auto Recycle() -> MoveOutcome;
        auto OfferBury() -> MoveOutcome;
        auto Win() -> MoveOutcome;
        auto Lose() -> MoveOutcome;

        auto ResetPlay() -> void;

    private:
        Config cfg_;
        std::unique_ptr<Player> player_;
        std::unique_ptr<DrawRules> draw_rules_;
        std::mt19937_64 rng_;
        uint64_t deal_seed_;

        // Authoritative state
        GameState state_;
        UndoStack undo_;
        GameTimer timer_;

        // Interaction state
        Cursor cursor_{};
        std::optional<Selection> selection_;
        std::optional<HighlightedDestinations> highlighted_;
        std::string message_;

        uint32_t move_count_{0};
        SessionStatus status_{SessionStatus::Playing};

        // Stall tracking
        bool made_progress_{true};
        uint32_t consecutive_burials_{0};
    };
}

#endif //KLONDIKE_SESSION_HPP
