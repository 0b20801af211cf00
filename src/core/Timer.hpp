//
// Created by Malik T on 18/08/2025.
//

#ifndef KLONDIKE_TIMER_HPP
#define KLONDIKE_TIMER_HPP

#include <chrono>

namespace klondike::core
{
    // Game time that only accumulates while running; survives pause/resume and save/restore.
    class GameTimer
    {
    public:
        using Clock = std::chrono::steady_clock;

        auto Start() -> void;  // no-op when already running
        auto Pause() -> void;  // no-op when not running
        auto Resume() -> void; // no-op when not paused
        auto Reset() -> void;  // zero and stopped

        [[nodiscard]] auto Elapsed() const -> std::chrono::milliseconds;
        // negative values clamp to zero
        auto SetElapsed(std::chrono::milliseconds elapsed) -> void;

        [[nodiscard]] auto IsRunning() const noexcept -> bool { return running_; }
        [[nodiscard]] auto IsPaused() const noexcept -> bool { return paused_; }

    private:
        Clock::time_point started_{};
        std::chrono::milliseconds accumulated_{0};
        bool running_{false};
        bool paused_{false};
    };
}

#endif //KLONDIKE_TIMER_HPP
