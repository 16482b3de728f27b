#ifndef _ONGOINGCALL_H_
#define _ONGOINGCALL_H_

#include "audioplayer.h"
#include "useragent.h"

#include <atomic>
#include <memory>
#include <string>

namespace ivr {

// An answered call as kept in the CallRegistry.
class OngoingCall
{
public:
    OngoingCall(std::string call_id,
                std::shared_ptr<UserAgent> user_agent,
                std::shared_ptr<ServerCall> server_call,
                std::shared_ptr<AudioPlayer> player);

    // Hangs up both legs of the signaling and stops the audio. Only the
    // first call does anything.
    void hangup();
    bool isHungUp() const { return hung_up_.load(); }

    const std::string &callId() const { return call_id_; }
    AudioPlayer &player() { return *player_; }

private:
    std::string call_id_;
    std::shared_ptr<UserAgent> user_agent_;
    std::shared_ptr<ServerCall> server_call_;
    std::shared_ptr<AudioPlayer> player_;
    std::atomic<bool> hung_up_;
};

} // namespace ivr

#endif // _ONGOINGCALL_H_
