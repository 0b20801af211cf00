//
// Created by Malik T on 18/08/2025.
//

#include "Timer.hpp"

#include <algorithm>

namespace klondike::core
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    auto GameTimer::Start() -> void
    {
        if (running_) return;
        started_ = Clock::now();
        running_ = true;
        paused_ = false;
    }

    auto GameTimer::Pause() -> void
    {
        if (!running_) return;
        accumulated_ += duration_cast<milliseconds>(Clock::now() - started_);
        running_ = false;
        paused_ = true;
    }

    auto GameTimer::Resume() -> void
    {
        if (!paused_) return;
        started_ = Clock::now();
        running_ = true;
        paused_ = false;
    }

    auto GameTimer::Reset() -> void
    {
        started_ = {};
        accumulated_ = milliseconds{0};
        running_ = false;
        paused_ = false;
    }

    auto GameTimer::Elapsed() const -> milliseconds
    {
        if (running_) return accumulated_ + duration_cast<milliseconds>(Clock::now() - started_);
        return accumulated_;
    }

    auto GameTimer::SetElapsed(milliseconds const elapsed) -> void
    {
        accumulated_ = std::max(elapsed, milliseconds{0});
        if (running_) started_ = Clock::now();
    }
}
