#include <gtest/gtest.h>

#include "../core/Dealer.hpp"
#include "../core/Session.hpp"
#include "../core/Util.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/ScriptedPlayer.hpp"
#include "TestBoards.hpp"

using namespace klondike::core;
using klondike::test::Down;
using klondike::test::Goto;
using klondike::test::RecordOf;
using klondike::test::Up;

namespace
{
    auto NewSession(DrawMode const mode = DrawMode::One, uint64_t const seed = 99) -> Session
    {
        return Session(Config{.draw_mode = mode, .seed = seed}, std::make_unique<debug::ScriptedPlayer>());
    }

    //  T0: 9♠   T1: 8♥   T2: A♥   T3: ## 7♦ 6♠   T4: -   T5: K♣   T6: -
    auto Playable() -> GameState
    {
        GameState s{};
        s.tableau[0] = {Up(Rank::Nine, Suit::Spades)};
        s.tableau[1] = {Up(Rank::Eight, Suit::Hearts)};
        s.tableau[2] = {Up(Rank::Ace, Suit::Hearts)};
        s.tableau[3] = {Down(Rank::Five, Suit::Clubs), Up(Rank::Seven, Suit::Diamonds), Up(Rank::Six, Suit::Spades)};
        s.tableau[5] = {Up(Rank::King, Suit::Clubs)};
        klondike::test::FillStock(s);
        return s;
    }

    auto LoadBoard(Session& session, GameState state) -> void
    {
        auto const loaded = session.Load(RecordOf(std::move(state), session.Mode()));
        ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    }
}

TEST(Session, Fresh_Deal)
{
    Session s = NewSession();

    EXPECT_EQ(s.State(), Dealer::Deal(99));
    EXPECT_EQ(s.DealSeed(), 99u);
    EXPECT_EQ(s.Status(), SessionStatus::Playing);
    EXPECT_EQ(s.CursorNow(), Cursor{});
    EXPECT_FALSE(s.CurrentSelection().has_value());
    EXPECT_FALSE(s.CanUndo());
    EXPECT_EQ(s.MoveCount(), 0u);
    EXPECT_TRUE(s.MadeProgressSinceLastRecycle());
    EXPECT_EQ(s.ConsecutiveBurials(), 0u);
    EXPECT_FALSE(s.CheckWin());
    EXPECT_FALSE(s.Message().empty());
    EXPECT_NO_THROW(debug::CheckInvariants(s));
}

TEST(Session, Construction_Errors)
{
    EXPECT_THROW(Session(Config{.seed = 1}, nullptr), error::AssertionError);
    EXPECT_THROW(Session(Config{.seed = 1, .undo_capacity = 0}, std::make_unique<debug::ScriptedPlayer>()),
                 error::ConfigError);
}

TEST(Session, Select_On_Stock_Draws)
{
    Session one = NewSession(DrawMode::One);
    EXPECT_EQ(one.Select(), MoveOutcome::Applied);
    EXPECT_EQ(one.State().waste.size(), 1u);
    EXPECT_EQ(one.State().stock.size(), 23u);
    EXPECT_EQ(one.MoveCount(), 1u);
    EXPECT_EQ(one.Message(), "Drew 1 card(s) from stock.");
    EXPECT_TRUE(one.CanUndo());

    Session three = NewSession(DrawMode::Three);
    EXPECT_EQ(three.Dispatch(Action::StockAction), MoveOutcome::Applied);
    EXPECT_EQ(three.State().waste.size(), 3u);
    EXPECT_EQ(three.Message(), "Drew 3 card(s) from stock.");
    EXPECT_NO_THROW(debug::CheckInvariants(three));
}

TEST(Session, Select_Failures)
{
    Session s = NewSession();
    Goto(s, Zone::Waste);
    EXPECT_EQ(s.Select(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Waste is empty!");

    Goto(s, Zone::Foundation, 2);
    EXPECT_EQ(s.Select(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Foundation is empty!");

    GameState board = Playable();
    board.tableau[6] = {Down(Rank::Two, Suit::Diamonds)};
    board.stock.erase(std::ranges::find(board.stock, Down(Rank::Two, Suit::Diamonds)));
    LoadBoard(s, board);

    Goto(s, Zone::Tableau, 4);
    EXPECT_EQ(s.Select(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Tableau pile is empty!");

    Goto(s, Zone::Tableau, 6);
    EXPECT_EQ(s.Select(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Cannot select face-down card!");
    EXPECT_FALSE(s.CurrentSelection().has_value());
}

TEST(Session, Tableau_Move_Through_Selection)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Tableau, 1);
    EXPECT_EQ(s.Select(), MoveOutcome::Applied);
    EXPECT_EQ(s.Message(), "Card selected. Press Tab to see placements.");
    EXPECT_EQ(s.DescribeSelection(), "8♥");
    ASSERT_TRUE(s.CurrentSelection().has_value());
    EXPECT_EQ(s.CurrentSelection()->zone, Zone::Tableau);
    EXPECT_EQ(s.CurrentSelection()->pile_index, 1u);

    Goto(s, Zone::Tableau, 0);
    EXPECT_EQ(s.Place(), MoveOutcome::Applied);
    EXPECT_EQ(s.Message(), "Moved!");
    EXPECT_EQ(s.State().tableau[0], (Pile{Up(Rank::Nine, Suit::Spades), Up(Rank::Eight, Suit::Hearts)}));
    EXPECT_TRUE(s.State().tableau[1].empty());
    EXPECT_FALSE(s.CurrentSelection().has_value());
    EXPECT_EQ(s.MoveCount(), 1u);
    EXPECT_TRUE(s.CanUndo());
    EXPECT_NO_THROW(debug::CheckInvariants(s));
}

TEST(Session, Run_Cannot_Go_To_Foundation)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Tableau, 3, 1);
    EXPECT_EQ(s.Select(), MoveOutcome::Applied);
    EXPECT_EQ(s.Message(), "2 cards selected. Press Tab to see placements.");
    EXPECT_EQ(s.DescribeSelection(), "7♦ + 1 more");

    Goto(s, Zone::Foundation, 1);
    EXPECT_EQ(s.Place(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Can only move single card to foundation!");
    EXPECT_TRUE(s.CurrentSelection().has_value());
    EXPECT_FALSE(s.CanUndo());
}

TEST(Session, Illegal_Move_Keeps_Selection_And_State)
{
    Session s = NewSession();
    LoadBoard(s, Playable());
    GameState const before = s.State();

    Goto(s, Zone::Tableau, 2);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    Goto(s, Zone::Tableau, 0);
    EXPECT_EQ(s.Dispatch(Action::Place), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Invalid move: Cannot place there");
    EXPECT_TRUE(s.CurrentSelection().has_value());
    EXPECT_EQ(s.State(), before);
    EXPECT_EQ(s.MoveCount(), 0u);
    // the speculative snapshot was discarded
    EXPECT_FALSE(s.CanUndo());
}

TEST(Session, Foundation_Moves)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Tableau, 2);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    Goto(s, Zone::Foundation, 0);
    EXPECT_EQ(s.Place(), MoveOutcome::Applied);
    EXPECT_EQ(s.Message(), "Moved to foundation!");
    EXPECT_EQ(s.State().foundations[0], (Pile{Up(Rank::Ace, Suit::Hearts)}));
    EXPECT_TRUE(s.State().tableau[2].empty());

    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    EXPECT_EQ(s.DescribeSelection(), "A♥");
    Goto(s, Zone::Foundation, 1);
    EXPECT_EQ(s.Place(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Cannot move foundation to foundation!");
}

TEST(Session, Cannot_Place_On_Stock_Or_Waste)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Tableau, 1);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);

    Goto(s, Zone::Stock);
    EXPECT_EQ(s.Place(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Cannot place cards on stock!");

    Goto(s, Zone::Waste);
    EXPECT_EQ(s.Place(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Cannot place cards on waste!");
    EXPECT_TRUE(s.CurrentSelection().has_value());
}

TEST(Session, Place_On_Own_Pile_And_Cancel)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    EXPECT_EQ(s.Place(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Nothing selected!");

    Goto(s, Zone::Tableau, 1);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    EXPECT_EQ(s.Place(), MoveOutcome::Applied);
    EXPECT_FALSE(s.CurrentSelection().has_value());
    EXPECT_EQ(s.Message(), "Selection cancelled.");
    EXPECT_EQ(s.MoveCount(), 0u);

    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    s.Cancel();
    s.Cancel();
    EXPECT_FALSE(s.CurrentSelection().has_value());
    EXPECT_EQ(s.DescribeSelection(), "");
}

TEST(Session, Stock_Action_Clears_Selection)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Tableau, 1);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    EXPECT_EQ(s.StockAction(), MoveOutcome::Applied);
    EXPECT_FALSE(s.CurrentSelection().has_value());
}

TEST(Session, Hints_From_Cursor_And_Selection)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Tableau, 1);
    std::optional<HighlightedDestinations> const eight = s.ComputeValidDestinations();
    ASSERT_TRUE(eight.has_value());
    EXPECT_EQ(eight->tableau_piles, (std::vector<size_t>{0}));
    EXPECT_TRUE(eight->foundation_piles.empty());
    EXPECT_EQ(s.Message(), "1 valid placement(s) highlighted.");
    EXPECT_EQ(s.Highlighted(), eight);

    // any dispatched action drops the highlights
    EXPECT_EQ(s.Dispatch(Action::MoveRight), MoveOutcome::Applied);
    EXPECT_FALSE(s.Highlighted().has_value());

    Goto(s, Zone::Tableau, 5);
    EXPECT_EQ(s.Dispatch(Action::ShowHints), MoveOutcome::Applied);
    ASSERT_TRUE(s.Highlighted().has_value());
    EXPECT_EQ(s.Highlighted()->tableau_piles, (std::vector<size_t>{4, 6}));
    EXPECT_EQ(s.Message(), "2 valid placement(s) highlighted.");

    Goto(s, Zone::Tableau, 2);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    Goto(s, Zone::Stock);
    std::optional<HighlightedDestinations> const ace = s.ComputeValidDestinations();
    ASSERT_TRUE(ace.has_value());
    EXPECT_EQ(ace->foundation_piles, (std::vector<size_t>{0}));
    EXPECT_TRUE(ace->tableau_piles.empty());
}

TEST(Session, Hints_Without_Card_Or_Destination)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Stock);
    EXPECT_EQ(s.Dispatch(Action::ShowHints), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "No card to show placements for!");

    Goto(s, Zone::Tableau, 3, 2);
    EXPECT_FALSE(s.ComputeValidDestinations().has_value());
    EXPECT_EQ(s.Message(), "No valid placements for this card!");
    EXPECT_FALSE(s.Highlighted().has_value());
}

TEST(Session, Hints_For_A_Run_Skip_Foundations)
{
    GameState board{};
    klondike::test::BuildFoundations(board, {6, 0, 0, 0});
    board.tableau[0] = {Up(Rank::Eight, Suit::Clubs)};
    board.tableau[3] = {Down(Rank::Five, Suit::Clubs), Up(Rank::Seven, Suit::Hearts), Up(Rank::Six, Suit::Spades)};
    klondike::test::FillStock(board);

    Session s = NewSession();
    LoadBoard(s, board);

    Goto(s, Zone::Tableau, 3, 1);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    std::optional<HighlightedDestinations> const run = s.ComputeValidDestinations();
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->tableau_piles, (std::vector<size_t>{0}));
    EXPECT_TRUE(run->foundation_piles.empty());
}

TEST(Session, Winning_Move_Ends_The_Game)
{
    Session s = NewSession();
    LoadBoard(s, klondike::test::OneMoveFromWin());
    EXPECT_FALSE(s.CheckWin());

    Goto(s, Zone::Tableau, 0);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    Goto(s, Zone::Foundation, 3);
    EXPECT_EQ(s.Dispatch(Action::Place), MoveOutcome::Won);
    EXPECT_TRUE(s.CheckWin());
    EXPECT_EQ(s.Status(), SessionStatus::Won);
    EXPECT_EQ(s.Message(), "Congratulations! You won in 1 moves!");
    EXPECT_NO_THROW(debug::CheckInvariants(s));

    EXPECT_EQ(s.Dispatch(Action::Select), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Game over. Restart to play again.");
    EXPECT_EQ(s.Dispatch(Action::MoveDown), MoveOutcome::Invalid);
    EXPECT_FALSE(s.Undo());

    EXPECT_EQ(s.Dispatch(Action::Restart), MoveOutcome::Applied);
    EXPECT_EQ(s.Status(), SessionStatus::Playing);
    EXPECT_EQ(s.MoveCount(), 0u);
    EXPECT_FALSE(s.CanUndo());
    EXPECT_EQ(util::FoundationTotal(s.State()), 0u);
}

TEST(Session, Undo_Restores_Each_Step)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    std::vector<GameState> history;
    auto const act = [&](auto&& fn)
    {
        history.push_back(s.State());
        fn();
    };

    act([&] { Goto(s, Zone::Tableau, 1); s.Select(); Goto(s, Zone::Tableau, 0); ASSERT_EQ(s.Place(), MoveOutcome::Applied); });
    act([&] { ASSERT_EQ(s.StockAction(), MoveOutcome::Applied); });
    act([&] { Goto(s, Zone::Tableau, 2); s.Select(); Goto(s, Zone::Foundation, 0); ASSERT_EQ(s.Place(), MoveOutcome::Applied); });
    act([&] { ASSERT_EQ(s.StockAction(), MoveOutcome::Applied); });
    ASSERT_EQ(s.MoveCount(), 4u);

    while (!history.empty())
    {
        ASSERT_TRUE(s.Undo());
        EXPECT_EQ(s.Message(), "Undone!");
        EXPECT_EQ(s.State(), history.back());
        EXPECT_EQ(s.MoveCount(), history.size() - 1);
        history.pop_back();
        EXPECT_NO_THROW(debug::CheckInvariants(s));
    }

    GameState const start = s.State();
    EXPECT_FALSE(s.Undo());
    EXPECT_EQ(s.Message(), "Nothing to undo!");
    EXPECT_EQ(s.State(), start);
    EXPECT_EQ(s.MoveCount(), 0u);
}

TEST(Session, Undo_Clamps_Cursor_And_Clears_Selection)
{
    Session s = NewSession();
    LoadBoard(s, Playable());

    Goto(s, Zone::Tableau, 1);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);
    Goto(s, Zone::Tableau, 0);
    ASSERT_EQ(s.Place(), MoveOutcome::Applied);

    Goto(s, Zone::Tableau, 0, 1);
    ASSERT_EQ(s.CursorNow().card_index, 1u);
    ASSERT_EQ(s.Select(), MoveOutcome::Applied);

    ASSERT_TRUE(s.Undo());
    EXPECT_EQ(s.CursorNow(), (Cursor{.zone = Zone::Tableau, .pile_index = 0, .card_index = 0}));
    EXPECT_FALSE(s.CurrentSelection().has_value());
}

TEST(Session, Snapshot_Mirrors_Session)
{
    Session s = NewSession(DrawMode::Three);
    ASSERT_EQ(s.StockAction(), MoveOutcome::Applied);
    s.MoveCursor(Direction::Right);

    std::shared_ptr<SessionView const> const view = s.Snapshot();
    EXPECT_EQ(view->state, s.State());
    EXPECT_EQ(view->cursor, s.CursorNow());
    EXPECT_EQ(view->message, s.Message());
    EXPECT_EQ(view->move_count, 1u);
    EXPECT_EQ(view->status, SessionStatus::Playing);
    EXPECT_EQ(view->draw_mode, DrawMode::Three);
    EXPECT_TRUE(view->can_undo);
    EXPECT_TRUE(view->made_progress_since_last_recycle);
    EXPECT_EQ(view->consecutive_burials, 0u);

    // the view is a copy
    ASSERT_EQ(s.StockAction(), MoveOutcome::Applied);
    EXPECT_EQ(view->move_count, 1u);
    EXPECT_NE(view->state, s.State());
}

TEST(Session, Record_Round_Trip)
{
    Session a = NewSession();
    LoadBoard(a, Playable());
    Goto(a, Zone::Tableau, 1);
    a.Select();
    Goto(a, Zone::Tableau, 0);
    ASSERT_EQ(a.Place(), MoveOutcome::Applied);

    SessionRecord const rec = a.ToRecord();
    EXPECT_EQ(rec.move_count, 1u);
    EXPECT_EQ(rec.made_progress_since_last_recycle, std::optional<bool>{true});
    EXPECT_EQ(rec.consecutive_burials, std::optional<uint32_t>{0});

    Session b = NewSession(DrawMode::Three, 7);
    ASSERT_TRUE(b.Load(rec).has_value());
    EXPECT_EQ(b.State(), a.State());
    EXPECT_EQ(b.MoveCount(), 1u);
    EXPECT_EQ(b.Mode(), DrawMode::One);
    EXPECT_EQ(b.Message(), "Game loaded.");
    EXPECT_FALSE(b.CanUndo());
    EXPECT_GE(b.Elapsed(), rec.elapsed);
}

TEST(Session, Load_Fills_Missing_Stall_Fields)
{
    Session s = NewSession();

    SessionRecord legacy = RecordOf(klondike::test::ExhaustedPass(), DrawMode::Three);
    ASSERT_TRUE(s.Load(legacy).has_value());
    EXPECT_TRUE(s.MadeProgressSinceLastRecycle());
    EXPECT_EQ(s.ConsecutiveBurials(), 0u);
    EXPECT_EQ(s.Mode(), DrawMode::Three);

    legacy.made_progress_since_last_recycle = false;
    legacy.consecutive_burials = 2;
    ASSERT_TRUE(s.Load(legacy).has_value());
    EXPECT_FALSE(s.MadeProgressSinceLastRecycle());
    EXPECT_EQ(s.ConsecutiveBurials(), 2u);
}

TEST(Session, Load_Rejects_Malformed_Records)
{
    Session s = NewSession();
    ASSERT_EQ(s.StockAction(), MoveOutcome::Applied);
    GameState const before = s.State();

    GameState dup = Dealer::Deal(1);
    dup.stock[0] = dup.stock[1];
    auto const r1 = s.Load(RecordOf(dup));
    ASSERT_FALSE(r1.has_value());
    EXPECT_NE(r1.error().message.find("52"), std::string::npos);

    GameState bad_foundation{};
    bad_foundation.foundations[0] = {Up(Rank::Two, Suit::Hearts)};
    klondike::test::FillStock(bad_foundation);
    auto const r2 = s.Load(RecordOf(bad_foundation));
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error().message, "Foundation 0 is out of order at 0");

    GameState shown_stock = Dealer::Deal(1);
    shown_stock.stock.back() = shown_stock.stock.back().FaceUp();
    EXPECT_FALSE(s.Load(RecordOf(shown_stock)).has_value());

    // a draw mode other than 1 or 3 is an error value, not a ConfigError
    SessionRecord two_card = RecordOf(Dealer::Deal(5));
    two_card.draw_mode = static_cast<DrawMode>(2);
    std::expected<void, RecordError> r4;
    EXPECT_NO_THROW(r4 = s.Load(two_card));
    ASSERT_FALSE(r4.has_value());
    EXPECT_EQ(r4.error().message, "Record has draw mode 2, expected 1 or 3");

    // out-of-range rank and suit are caught before the deck check indexes by them
    GameState junk = Dealer::Deal(5);
    junk.stock.back() = Card(static_cast<Rank>(200), static_cast<Suit>(9));
    auto const r5 = s.Load(RecordOf(junk));
    ASSERT_FALSE(r5.has_value());
    EXPECT_EQ(r5.error().message, "Record holds an impossible card (rank 200, suit 9)");

    GameState no_rank = Dealer::Deal(5);
    no_rank.tableau[6].front() = Card(static_cast<Rank>(0), Suit::Clubs);
    EXPECT_FALSE(s.Load(RecordOf(no_rank)).has_value());

    // untouched by any of the rejects
    EXPECT_EQ(s.State(), before);
    EXPECT_EQ(s.MoveCount(), 1u);
    EXPECT_TRUE(s.CanUndo());
}

TEST(Session, Loading_A_Finished_Board_Is_Won)
{
    GameState done{};
    klondike::test::BuildFoundations(done, {13, 13, 13, 13});

    Session s = NewSession();
    ASSERT_TRUE(s.Load(RecordOf(done)).has_value());
    EXPECT_EQ(s.Status(), SessionStatus::Won);
}

TEST(Session, Restart_Deals_Again)
{
    Session s = NewSession();
    ASSERT_EQ(s.StockAction(), MoveOutcome::Applied);

    s.Restart(555);
    EXPECT_EQ(s.State(), Dealer::Deal(555));
    EXPECT_EQ(s.DealSeed(), 555u);
    EXPECT_FALSE(s.CanUndo());
    EXPECT_EQ(s.MoveCount(), 0u);
    EXPECT_EQ(s.CursorNow(), Cursor{});

    // without a seed the next deal comes from the session's own generator
    Session twin = NewSession();
    s.Restart();
    twin.Restart();
    EXPECT_EQ(s.DealSeed(), twin.DealSeed());
    EXPECT_EQ(s.State(), Dealer::Deal(s.DealSeed()));
}

TEST(Session, Step_Pulls_From_Player)
{
    auto player = std::make_unique<debug::ScriptedPlayer>(
        std::initializer_list<Action>{Action::MoveRight, Action::Select});
    debug::ScriptedPlayer* script = player.get();
    Session s(Config{.seed = 3}, std::move(player));

    EXPECT_EQ(s.Step(), MoveOutcome::Applied);
    EXPECT_EQ(s.CursorNow().zone, Zone::Waste);
    EXPECT_EQ(s.Step(), MoveOutcome::Invalid);
    EXPECT_EQ(s.Message(), "Waste is empty!");
    EXPECT_EQ(script->Remaining(), 0u);
    EXPECT_THROW(s.Step(), error::InvalidActionError);
}
