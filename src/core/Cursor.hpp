//
// Created by Malik T on 17/08/2025.
//

#ifndef KLONDIKE_CURSOR_HPP
#define KLONDIKE_CURSOR_HPP

#include "State.hpp"

// Focus movement over the board. The board is two rows:
//   STOCK  WASTE  FOUNDATION[0..3]
//   TABLEAU[0..6]
// Each (zone, direction) pair owns exactly one rule in a fixed table; the state
// is only read to decide where inside a tableau pile the focus lands.
namespace klondike::core::nav
{
    auto Move(Cursor cursor, Direction dir, GameState const& state) -> Cursor;

    // Index of the first face-up card in the focused tableau pile, 0 elsewhere.
    auto FirstSelectableIndex(Cursor const& cursor, GameState const& state) -> size_t;

    // Pulls a tableau card index up to the first face-up card.
    auto SnapToSelectable(Cursor cursor, GameState const& state) -> Cursor;

    // Re-validates a cursor after the cards under it changed (move, undo, load).
    auto Clamp(Cursor cursor, GameState const& state) -> Cursor;
}

#endif //KLONDIKE_CURSOR_HPP
