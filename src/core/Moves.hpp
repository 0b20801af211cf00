//
// Created by Malik T on 16/08/2025.
//

#ifndef KLONDIKE_MOVES_HPP
#define KLONDIKE_MOVES_HPP

#include "Exception.hpp"
#include "State.hpp"

// State-mutating moves. Every operation validates fully before touching the
// state, so a failed move leaves the GameState exactly as it was.
namespace klondike::core::moves
{
    // Moves src[card_index..] onto dest and reveals the card left on top of src.
    auto MoveTableauToTableau(GameState& state, size_t src_pile, size_t card_index, size_t dest_pile) -> MoveResult;

    auto MoveWasteToTableau(GameState& state, size_t dest_pile) -> MoveResult;
    auto MoveWasteToFoundation(GameState& state, size_t dest_foundation) -> MoveResult;

    // Only the single top card may go; a card_index below the top is rejected.
    auto MoveTableauToFoundation(GameState& state, size_t src_pile, size_t dest_foundation,
                                 std::optional<size_t> card_index = std::nullopt) -> MoveResult;

    auto MoveFoundationToTableau(GameState& state, size_t src_foundation, size_t dest_pile) -> MoveResult;

    auto DrawFromStock(GameState& state, size_t draw_count) -> MoveResult;
    // Reverses the waste back into the stock so the next pass repeats the last one.
    auto RecycleWasteToStock(GameState& state) -> MoveResult;
    // Draw-3 stall recovery: stock top goes to the bottom, no flip.
    auto BuryTopOfStock(GameState& state) -> MoveResult;

    // Flips a face-down top card up. Returns true when a card was revealed.
    auto RevealTop(Pile& pile) -> bool;
}

#endif //KLONDIKE_MOVES_HPP
