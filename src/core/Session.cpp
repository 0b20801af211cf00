//
// Created by Malik T on 20/08/2025.
//

#include "Session.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include "Cursor.hpp"
#include "Dealer.hpp"
#include "Format.hpp"
#include "Moves.hpp"
#include "Rules.hpp"
#include "Util.hpp"

namespace klondike::core
{
    using RVC = error::RuleViolationCode;

    Session::Session(Config const& config, std::unique_ptr<Player> player) :
        cfg_(config),
        player_(std::move(player)),
        draw_rules_(MakeDrawRules(cfg_.draw_mode)),
        rng_{cfg_.seed},
        deal_seed_{cfg_.seed},
        state_(Dealer::Deal(deal_seed_)),
        undo_(cfg_.undo_capacity)
    {
        KLD_ASSERT(player_ != nullptr, "Session constructed without a player");
        KLD_ASSERT(util::HoldsFullDeck(state_), "Deal did not produce a full deck");
        message_ = std::format("New game ({}). Good luck!", to_string(draw_rules_->Mode()));
    }

    auto Session::Step() -> MoveOutcome
    {
        Action const action = player_->NextAction(Snapshot());
        return Dispatch(action);
    }

    auto Session::Dispatch(Action const action) -> MoveOutcome
    {
        highlighted_.reset();

        if (action != Action::Restart && IsOver()) return MoveOutcome::Invalid;

        switch (action)
        {
        case Action::MoveUp: return MoveCursor(Direction::Up);
        case Action::MoveDown: return MoveCursor(Direction::Down);
        case Action::MoveLeft: return MoveCursor(Direction::Left);
        case Action::MoveRight: return MoveCursor(Direction::Right);
        case Action::Select: return Select();
        case Action::Place: return Place();
        case Action::Cancel:
            Cancel();
            return MoveOutcome::Applied;
        case Action::StockAction: return StockAction();
        case Action::Undo: return Undo() ? MoveOutcome::Applied : MoveOutcome::Invalid;
        case Action::Restart:
            Restart();
            return MoveOutcome::Applied;
        case Action::ShowHints: return ComputeValidDestinations() ? MoveOutcome::Applied : MoveOutcome::Invalid;
        }
        KLD_THROW(error::Code::InvalidAction, std::format("Unknown action {}", std::to_underlying(action)));
    }

    auto Session::IsOver() -> bool
    {
        if (status_ == SessionStatus::Playing) return false;
        message_ = error::message(error::Viol(RVC::Session_GameOver));
        return true;
    }

    auto Session::Reject(RVC const code) -> MoveOutcome
    {
        message_ = error::message(error::Viol(code));
        return MoveOutcome::Invalid;
    }

    auto Session::MoveCursor(Direction const dir) -> MoveOutcome
    {
        if (IsOver()) return MoveOutcome::Invalid;
        cursor_ = nav::Move(cursor_, dir, state_);
        return MoveOutcome::Applied;
    }

    auto Session::Select() -> MoveOutcome
    {
        if (IsOver()) return MoveOutcome::Invalid;

        Selection sel{.zone = cursor_.zone, .pile_index = cursor_.pile_index, .card_index = 0};
        switch (cursor_.zone)
        {
        case Zone::Stock:
            return StockAction();
        case Zone::Waste:
            if (!rules::CanPickFromWaste(state_)) return Reject(RVC::Select_WasteEmpty);
            sel.pile_index = 0;
            break;
        case Zone::Foundation:
            if (state_.foundations.at(cursor_.pile_index).empty()) return Reject(RVC::Select_FoundationEmpty);
            break;
        case Zone::Tableau:
        {
            Pile const& pile = state_.tableau.at(cursor_.pile_index);
            if (pile.empty()) return Reject(RVC::Select_TableauEmpty);
            if (!rules::CanPickFromTableau(pile, cursor_.card_index)) return Reject(RVC::Select_FaceDown);
            sel.card_index = cursor_.card_index;
            break;
        }
        }

        selection_ = sel;
        size_t const n = sel.zone == Zone::Tableau ? state_.tableau[sel.pile_index].size() - sel.card_index : 1;
        message_ = n == 1
                       ? std::string("Card selected. Press Tab to see placements.")
                       : std::format("{} cards selected. Press Tab to see placements.", n);
        return MoveOutcome::Applied;
    }

    auto Session::Place() -> MoveOutcome
    {
        if (IsOver()) return MoveOutcome::Invalid;
        if (!selection_) return Reject(RVC::Place_NothingSelected);

        Selection const sel = *selection_;
        if (cursor_.zone == sel.zone && cursor_.pile_index == sel.pile_index)
        {
            Cancel();
            return MoveOutcome::Applied;
        }

        switch (cursor_.zone)
        {
        case Zone::Stock: return Reject(RVC::Place_OnStock);
        case Zone::Waste: return Reject(RVC::Place_OnWaste);
        case Zone::Foundation: return MoveToFoundation(sel, cursor_.pile_index);
        case Zone::Tableau: return MoveToTableau(sel, cursor_.pile_index);
        }
        KLD_THROW(error::Code::State, "Cursor in an unknown zone");
    }

    auto Session::MoveToFoundation(Selection const& sel, size_t const dest) -> MoveOutcome
    {
        if (sel.zone == Zone::Foundation) return Reject(RVC::Place_FoundationToFoundation);
        if (sel.zone == Zone::Tableau && sel.card_index + 1 != state_.tableau.at(sel.pile_index).size())
            return Reject(RVC::Place_RunToFoundation);

        undo_.Push(state_);
        MoveResult result;
        switch (sel.zone)
        {
        case Zone::Waste:
            result = moves::MoveWasteToFoundation(state_, dest);
            break;
        case Zone::Tableau:
            result = moves::MoveTableauToFoundation(state_, sel.pile_index, dest, sel.card_index);
            break;
        case Zone::Stock:
        case Zone::Foundation:
            KLD_THROW(error::Code::State, "Selection in a zone that cannot feed a foundation");
        }
        return Resolve(result, "Moved to foundation!");
    }

    auto Session::MoveToTableau(Selection const& sel, size_t const dest) -> MoveOutcome
    {
        undo_.Push(state_);
        MoveResult result;
        switch (sel.zone)
        {
        case Zone::Waste:
            result = moves::MoveWasteToTableau(state_, dest);
            break;
        case Zone::Foundation:
            result = moves::MoveFoundationToTableau(state_, sel.pile_index, dest);
            break;
        case Zone::Tableau:
            result = moves::MoveTableauToTableau(state_, sel.pile_index, sel.card_index, dest);
            break;
        case Zone::Stock:
            KLD_THROW(error::Code::State, "Selection on the stock");
        }
        return Resolve(result, "Moved!");
    }

    auto Session::Resolve(MoveResult const& result, std::string_view const success_message) -> MoveOutcome
    {
        if (!result)
        {
            // the speculative entry must not become a no-op undo step
            undo_.Pop();
            message_ = std::format("Invalid move: {}", error::message(result.error()));
            return MoveOutcome::Invalid;
        }

        selection_.reset();
        ++move_count_;
        made_progress_ = true;
        consecutive_burials_ = 0;
        cursor_ = nav::Clamp(cursor_, state_);
        message_ = std::string(success_message);

        if (CheckWin()) return Win();
        return MoveOutcome::Applied;
    }

    auto Session::Cancel() -> void
    {
        selection_.reset();
        message_ = "Selection cancelled.";
    }

    auto Session::StockAction() -> MoveOutcome
    {
        if (IsOver()) return MoveOutcome::Invalid;
        selection_.reset();

        if (rules::CanDrawFromStock(state_))
        {
            size_t const before = state_.waste.size();
            undo_.Push(state_);
            if (auto const r = moves::DrawFromStock(state_, draw_rules_->DrawCount()); !r)
            {
                undo_.Pop();
                message_ = std::format("Invalid move: {}", error::message(r.error()));
                return MoveOutcome::Invalid;
            }
            ++move_count_;
            message_ = std::format("Drew {} card(s) from stock.", state_.waste.size() - before);
            return MoveOutcome::Applied;
        }

        if (state_.waste.empty()) return Reject(RVC::Stock_BothEmpty);

        switch (draw_rules_->OnPassExhausted(made_progress_, consecutive_burials_))
        {
        case StallVerdict::Recycle: return Recycle();
        case StallVerdict::OfferBury: return OfferBury();
        case StallVerdict::Lost: return Lose();
        }
        KLD_THROW(error::Code::Rules, "Unknown stall verdict");
    }

    auto Session::Recycle() -> MoveOutcome
    {
        undo_.Push(state_);
        if (auto const r = moves::RecycleWasteToStock(state_); !r)
        {
            undo_.Pop();
            message_ = std::format("Invalid move: {}", error::message(r.error()));
            return MoveOutcome::Invalid;
        }
        // tracking starts over for the pass that begins now
        made_progress_ = false;
        message_ = "Recycled waste to stock.";
        return MoveOutcome::Applied;
    }

    auto Session::OfferBury() -> MoveOutcome
    {
        bool const was_running = timer_.IsRunning();
        timer_.Pause();
        BuryDecision const decision = player_->DecideBury(Snapshot());
        if (was_running) timer_.Resume();

        if (decision == BuryDecision::Decline) return Lose();

        // stock is empty here, so the bury acts on the freshly recycled stock
        KLD_ASSERT(state_.stock.empty() && !state_.waste.empty(), "Bury offered away from the recycle point");
        undo_.Push(state_);
        auto const r = moves::RecycleWasteToStock(state_)
            .and_then([this] { return moves::BuryTopOfStock(state_); });
        KLD_ASSERT(r.has_value(), std::format("Bury failed at the recycle point: {}",
                                              r ? std::string{} : error::describe(r.error())));

        ++consecutive_burials_;
        made_progress_ = false;
        message_ = "Top card buried and stock recycled.";
        return MoveOutcome::Applied;
    }

    auto Session::Win() -> MoveOutcome
    {
        status_ = SessionStatus::Won;
        selection_.reset();
        timer_.Pause();
        message_ = std::format("Congratulations! You won in {} moves!", move_count_);
        return MoveOutcome::Won;
    }

    auto Session::Lose() -> MoveOutcome
    {
        status_ = SessionStatus::Lost;
        selection_.reset();
        timer_.Pause();
        message_ = "No legal moves remain. Game over.";
        return MoveOutcome::Lost;
    }

    auto Session::Undo() -> bool
    {
        if (IsOver()) return false;

        std::optional<GameState> previous = undo_.Pop();
        if (!previous)
        {
            Reject(RVC::Undo_Empty);
            return false;
        }

        state_ = std::move(*previous);
        move_count_ = move_count_ > 0 ? move_count_ - 1 : 0;
        selection_.reset();
        cursor_ = nav::Clamp(cursor_, state_);
        message_ = "Undone!";
        return true;
    }

    auto Session::ResetPlay() -> void
    {
        cursor_ = Cursor{};
        selection_.reset();
        highlighted_.reset();
        undo_.Clear();
        move_count_ = 0;
        status_ = SessionStatus::Playing;
        made_progress_ = true;
        consecutive_burials_ = 0;
    }

    auto Session::Restart(std::optional<uint64_t> const seed) -> void
    {
        deal_seed_ = seed ? *seed : rng_();
        state_ = Dealer::Deal(deal_seed_);
        ResetPlay();
        timer_.Reset();
        timer_.Start();
        message_ = std::format("New game ({}). Good luck!", to_string(draw_rules_->Mode()));
    }

    auto Session::CheckWin() const -> bool
    {
        return util::FoundationTotal(state_) == constants::DeckSize;
    }

    auto Session::SelectedCard() const -> std::optional<Card>
    {
        if (!selection_) return std::nullopt;

        switch (selection_->zone)
        {
        case Zone::Waste:
            if (state_.waste.empty()) return std::nullopt;
            return state_.waste.back();
        case Zone::Foundation:
        {
            Pile const& pile = state_.foundations.at(selection_->pile_index);
            if (pile.empty()) return std::nullopt;
            return pile.back();
        }
        case Zone::Tableau:
        {
            Pile const& pile = state_.tableau.at(selection_->pile_index);
            if (selection_->card_index >= pile.size()) return std::nullopt;
            return pile[selection_->card_index];
        }
        case Zone::Stock:
            break;
        }
        KLD_THROW(error::Code::State, "Selection on the stock");
    }

    auto Session::CardUnderCursor() const -> std::optional<Card>
    {
        Pile const* pile = nullptr;
        switch (cursor_.zone)
        {
        case Zone::Stock: return std::nullopt;
        case Zone::Waste:
            pile = &state_.waste;
            break;
        case Zone::Foundation:
            pile = &state_.foundations.at(cursor_.pile_index);
            break;
        case Zone::Tableau:
        {
            Pile const& t = state_.tableau.at(cursor_.pile_index);
            if (cursor_.card_index >= t.size() || !t[cursor_.card_index].face_up()) return std::nullopt;
            return t[cursor_.card_index];
        }
        }
        if (pile == nullptr || pile->empty()) return std::nullopt;
        return pile->back();
    }

    auto Session::DescribeSelection() const -> std::string
    {
        std::optional<Card> const card = SelectedCard();
        if (!card) return {};

        size_t extra{};
        if (selection_->zone == Zone::Tableau)
            extra = state_.tableau[selection_->pile_index].size() - selection_->card_index - 1;
        if (extra == 0) return std::format("{}", *card);
        return std::format("{} + {} more", *card, extra);
    }

    auto Session::ComputeValidDestinations() -> std::optional<HighlightedDestinations>
    {
        highlighted_.reset();
        if (IsOver()) return std::nullopt;

        std::optional<Card> const card = selection_ ? SelectedCard() : CardUnderCursor();
        if (!card)
        {
            Reject(RVC::Hints_NoCard);
            return std::nullopt;
        }

        HighlightedDestinations found{
            .tableau_piles = rules::ValidTableauDestinations(*card, state_),
            .foundation_piles = rules::ValidFoundationDestinations(*card, state_),
        };

        // the source pile never counts as a destination
        Selection const source = selection_.value_or(
            Selection{.zone = cursor_.zone, .pile_index = cursor_.pile_index, .card_index = cursor_.card_index});
        if (source.zone == Zone::Tableau)
        {
            std::erase(found.tableau_piles, source.pile_index);
            // a run can only go to the tableau
            if (source.card_index + 1 < state_.tableau[source.pile_index].size())
                found.foundation_piles.clear();
        }
        else if (source.zone == Zone::Foundation)
        {
            std::erase(found.foundation_piles, source.pile_index);
        }

        if (!found.HasAny())
        {
            Reject(RVC::Hints_NoDestinations);
            return std::nullopt;
        }

        message_ = std::format("{} valid placement(s) highlighted.", found.Count());
        highlighted_ = std::move(found);
        return highlighted_;
    }

    auto Session::Snapshot() const -> std::shared_ptr<SessionView const>
    {
        std::shared_ptr<SessionView> view = std::make_shared<SessionView>();
        view->state = state_;
        view->cursor = cursor_;
        view->selection = selection_;
        view->highlighted = highlighted_;
        view->message = message_;
        view->move_count = move_count_;
        view->elapsed = timer_.Elapsed();
        view->status = status_;
        view->draw_mode = draw_rules_->Mode();
        view->made_progress_since_last_recycle = made_progress_;
        view->consecutive_burials = consecutive_burials_;
        view->can_undo = undo_.CanUndo();
        return view;
    }

    auto Session::ToRecord() const -> SessionRecord
    {
        return SessionRecord{
            .state = state_,
            .move_count = move_count_,
            .elapsed = timer_.Elapsed(),
            .draw_mode = draw_rules_->Mode(),
            .made_progress_since_last_recycle = made_progress_,
            .consecutive_burials = consecutive_burials_,
        };
    }

    auto Session::Load(SessionRecord const& record) -> std::expected<void, RecordError>
    {
        ResumePoint resume = Migrate(record);
        if (auto const valid = ValidateRecord(resume); !valid)
            return std::unexpected(valid.error());

        std::unique_ptr<DrawRules> rules = MakeDrawRules(resume.draw_mode);

        // nothing below can fail
        draw_rules_ = std::move(rules);
        cfg_.draw_mode = resume.draw_mode;
        state_ = std::move(resume.state);
        ResetPlay();
        move_count_ = resume.move_count;
        made_progress_ = resume.made_progress_since_last_recycle;
        consecutive_burials_ = resume.consecutive_burials;

        bool const was_running = timer_.IsRunning();
        timer_.Reset();
        timer_.SetElapsed(resume.elapsed);
        if (was_running) timer_.Start();

        if (CheckWin())
        {
            status_ = SessionStatus::Won;
            timer_.Pause();
        }
        message_ = "Game loaded.";
        return {};
    }
}
