//
// Created by Malik T on 18/08/2025.
//

#include "UndoStack.hpp"

#include <utility>
#include "Exception.hpp"

namespace klondike::core
{
    UndoStack::UndoStack(size_t const capacity) :
        capacity_(capacity)
    {
        if (capacity_ == 0) KLD_THROW(error::Code::Config, "Undo capacity must be at least 1");
    }

    auto UndoStack::Push(GameState const& state) -> void
    {
        stack_.push_back(state);
        while (stack_.size() > capacity_)
        {
            stack_.pop_front();
        }
    }

    auto UndoStack::Pop() -> std::optional<GameState>
    {
        if (stack_.empty()) return std::nullopt;

        std::optional<GameState> top{std::move(stack_.back())};
        stack_.pop_back();
        return top;
    }
}
