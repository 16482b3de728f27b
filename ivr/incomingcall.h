#ifndef _INCOMINGCALL_H_
#define _INCOMINGCALL_H_

#include "audioplayer.h"
#include "callregistry.h"
#include "gate.h"
#include "keycollector.h"
#include "logger.h"
#include "mediasession.h"
#include "ongoingcall.h"
#include "useragent.h"
#include "workqueue.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ivr {

enum class CallState
{
    Ringing,
    Answering,
    GreetingPlaying,
    AwaitingDigits,
    PlayingDigits,
    Ended
};

const char *
toString(CallState state);

// Drives one incoming call: accept, answer, greet, then echo the digits the
// caller types back to them until the call ends.
//
// handle() runs on the signaling thread and returns once the greeting has
// been started on a thread of its own. Tone events are queued on a per-call
// worker, where they wait until the greeting has finished; hangup can
// arrive on any thread at any point and interrupts whatever is playing.
class IncomingCall : public std::enable_shared_from_this<IncomingCall>
{
public:
    IncomingCall(Logger &logger,
                 CallRegistry &registry,
                 std::shared_ptr<UserAgent> user_agent,
                 std::shared_ptr<MediaSession> media_session,
                 std::shared_ptr<AudioPlayer> player);
    ~IncomingCall();

    IncomingCall(const IncomingCall &) = delete;
    IncomingCall &operator=(const IncomingCall &) = delete;

    // Returns true when the call was answered and the greeting started.
    bool handle(const SipRequest &request);

    // Queues a tone for handleTone() and returns immediately.
    void onDtmfTone(uint8_t key, int duration_ms);

    // Blocks until the greeting is over, then applies the key policy.
    void handleTone(uint8_t key, int duration_ms);

    // Plays back and clears what the caller typed so far.
    void playCollectedKeys();

    void onHangup(const Dialogue &dialogue);
    void onRingTimeout();

    // Ends the call if still active and joins the call's threads. Must not
    // be called from a tone handler or the greeting.
    void close();

    CallState state() const { return state_.load(); }
    bool isEnded() const { return ended_.load(); }
    std::string callId() const;

    KeyCollector &keys() { return keys_; }

    void waitForGreeting();
    void flushTones();

private:
    void subscribe();
    void playGreeting();
    void playHelp();
    bool playSound(const Sound &sound);
    void setState(CallState state);
    bool terminate();
    void releaseCall();
    void fail(const std::string &what);

    Logger &logger_;
    CallRegistry &registry_;
    std::shared_ptr<UserAgent> user_agent_;
    std::shared_ptr<MediaSession> media_session_;
    std::shared_ptr<AudioPlayer> player_;

    std::atomic<CallState> state_;
    std::atomic<bool> ended_;

    // call_id_, server_call_, ongoing_ and registered_ are written by
    // handle() and taken over by whoever ends the call.
    mutable std::mutex call_mutex_;
    std::string call_id_;
    std::shared_ptr<ServerCall> server_call_;
    std::shared_ptr<OngoingCall> ongoing_;
    bool registered_;

    KeyCollector keys_;
    std::mutex playback_mutex_; // one playback round at a time
    Gate greeting_gate_;
    std::thread greeting_thread_;
    WorkQueue tone_queue_;
};

} // namespace ivr

#endif // _INCOMINGCALL_H_
