//
// Created by Malik T on 18/08/2025.
//

#ifndef KLONDIKE_UNDOSTACK_HPP
#define KLONDIKE_UNDOSTACK_HPP

#include <deque>
#include "State.hpp"

namespace klondike::core
{
    // Bounded history of full GameState copies. When full, the oldest entry is
    // dropped so the most recent undo depth is always kept.
    class UndoStack
    {
    public:
        explicit UndoStack(size_t capacity = constants::DefaultUndoCapacity);

        auto Push(GameState const& state) -> void;
        // nullopt when there is nothing to undo
        auto Pop() -> std::optional<GameState>;

        [[nodiscard]] auto CanUndo() const noexcept -> bool { return !stack_.empty(); }
        [[nodiscard]] auto Size() const noexcept -> size_t { return stack_.size(); }
        [[nodiscard]] auto Capacity() const noexcept -> size_t { return capacity_; }
        auto Clear() noexcept -> void { stack_.clear(); }

    private:
        size_t capacity_;
        std::deque<GameState> stack_;
    };
}

#endif //KLONDIKE_UNDOSTACK_HPP
