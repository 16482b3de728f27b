#include "ongoingcall.h"

#include <utility>

ivr::OngoingCall::OngoingCall(std::string call_id,
                              std::shared_ptr<UserAgent> user_agent,
                              std::shared_ptr<ServerCall> server_call,
                              std::shared_ptr<AudioPlayer> player) :
    call_id_(std::move(call_id)),
    user_agent_(std::move(user_agent)),
    server_call_(std::move(server_call)),
    player_(std::move(player)),
    hung_up_(false)
{
}

void ivr::OngoingCall::hangup()
{
    if (hung_up_.exchange(true)) {
        return;
    }

    user_agent_->hangup();
    if (server_call_) {
        server_call_->hangup();
    }
    player_->stop();
}
