//
// Created by malikt on 8/20/25.
//

#ifndef KLONDIKE_RECORDINGPLAYER_HPP
#define KLONDIKE_RECORDINGPLAYER_HPP

#include <memory>
#include <optional>
#include <utility>

#include "../core/Player.hpp"

namespace klondike::core::debug
{
    // Forwards to an inner player and remembers what it answered, so a transcript
    // can be written after Session::Step has already consumed the action.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto NextAction(std::shared_ptr<SessionView const> view) -> Action override
        {
            last_view_ = view;
            last_action_ = inner_->NextAction(std::move(view));
            has_last_ = true;
            return last_action_;
        }

        auto DecideBury(std::shared_ptr<SessionView const> view) -> BuryDecision override
        {
            last_bury_ = inner_->DecideBury(std::move(view));
            return *last_bury_;
        }

        auto HasLast() const -> bool
        {
            return has_last_;
        }

        auto Last() const -> Action
        {
            return last_action_;
        }

        // The view the last action was chosen from
        auto LastView() const -> std::shared_ptr<SessionView const> const&
        {
            return last_view_;
        }

        // Returns and clears the bury answer given since the previous call
        auto TakeBury() -> std::optional<BuryDecision>
        {
            return std::exchange(last_bury_, std::nullopt);
        }

    private:
        std::unique_ptr<Player> inner_;
        std::shared_ptr<SessionView const> last_view_;
        Action last_action_{Action::Cancel}; // harmless default
        bool has_last_{false};
        std::optional<BuryDecision> last_bury_;
    };

    // Downcast helper (only safe if the session was built with a RecordingPlayer)
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
} // namespace klondike::core::debug

#endif //KLONDIKE_RECORDINGPLAYER_HPP
