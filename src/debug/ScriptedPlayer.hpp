//
// Created by Malik T on 26/08/2025.
//

#ifndef KLONDIKE_SCRIPTEDPLAYER_HPP
#define KLONDIKE_SCRIPTEDPLAYER_HPP

#include <deque>
#include <initializer_list>
#include <memory>

#include "../core/Exception.hpp"
#include "../core/Player.hpp"

namespace klondike::core::debug
{
    // Replays a fixed list of actions and bury answers. Running past the end of
    // either list is a test bug and throws.
    class ScriptedPlayer final : public Player
    {
    public:
        ScriptedPlayer() = default;
        ScriptedPlayer(std::initializer_list<Action> actions, std::initializer_list<BuryDecision> burials = {})
            : actions_(actions), burials_(burials)
        {
        }

        auto Queue(Action a) -> void { actions_.push_back(a); }
        auto QueueBury(BuryDecision d) -> void { burials_.push_back(d); }

        auto NextAction(std::shared_ptr<SessionView const> view) -> Action override
        {
            (void)view;
            if (actions_.empty()) KLD_THROW(error::Code::InvalidAction, "Scripted player ran out of actions");
            Action const a = actions_.front();
            actions_.pop_front();
            return a;
        }

        auto DecideBury(std::shared_ptr<SessionView const> view) -> BuryDecision override
        {
            ++bury_requests_;
            last_bury_view_ = std::move(view);
            if (burials_.empty()) KLD_THROW(error::Code::InvalidAction, "Scripted player was not expecting a bury offer");
            BuryDecision const d = burials_.front();
            burials_.pop_front();
            return d;
        }

        auto BuryRequests() const -> size_t { return bury_requests_; }
        auto LastBuryView() const -> std::shared_ptr<SessionView const> const& { return last_bury_view_; }
        auto Remaining() const -> size_t { return actions_.size(); }

    private:
        std::deque<Action> actions_;
        std::deque<BuryDecision> burials_;
        size_t bury_requests_{0};
        std::shared_ptr<SessionView const> last_bury_view_;
    };
}

#endif //KLONDIKE_SCRIPTEDPLAYER_HPP
