#ifndef _USERAGENT_H_
#define _USERAGENT_H_

#include "mediasession.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace ivr {

class SignalingError : public std::runtime_error
{
public:
    explicit SignalingError(const std::string &what) :
        std::runtime_error(what) {}
};

// The parts of a received SIP request the call handling looks at.
struct SipRequest
{
    std::string method;
    std::string uri;
    std::string call_id;
    std::string from_tag;
    std::string to_tag;
    std::string local;   // receiving end point
    std::string source;  // remote end point
    int call_index = -1; // stack handle for INVITEs, -1 otherwise
};

struct Dialogue
{
    std::string call_id;
    std::string remote_uri;
};

// Server side of an INVITE transaction, valid between acceptCall() and the
// end of the call.
class ServerCall
{
public:
    virtual ~ServerCall() {}

    // The remote party cancelled before we answered.
    virtual bool
    isCancelled() const = 0;

    virtual void
    hangup() = 0;
};

// One call leg as seen by the IVR. Events may be delivered on any thread.
class UserAgent
{
public:
    typedef std::function<void(const Dialogue &)> HungUpHandler;
    typedef std::function<void(uint8_t key, int duration_ms)> DtmfToneHandler;
    typedef std::function<void()> RingTimeoutHandler;

    virtual ~UserAgent() {}

    // Starts the server transaction (provisional response). Throws
    // SignalingError when the stack refuses the call.
    virtual std::shared_ptr<ServerCall>
    acceptCall(const SipRequest &request) = 0;

    virtual bool
    answer(ServerCall &call, const std::shared_ptr<MediaSession> &session) = 0;

    // Only meaningful after answer().
    virtual Dialogue
    dialogue() const = 0;

    virtual bool
    isCallActive() const = 0;

    // Safe to call more than once.
    virtual void
    hangup() = 0;

    void setOnCallHungUp(HungUpHandler handler);
    void setOnDtmfTone(DtmfToneHandler handler);
    void setOnRingTimeout(RingTimeoutHandler handler);
    void clearHandlers();

protected:
    void notifyCallHungUp(const Dialogue &dialogue);
    void notifyDtmfTone(uint8_t key, int duration_ms);
    void notifyRingTimeout();

private:
    std::mutex handlers_mutex_;
    HungUpHandler on_hung_up_;
    DtmfToneHandler on_dtmf_tone_;
    RingTimeoutHandler on_ring_timeout_;
};

} // namespace ivr

#endif // _USERAGENT_H_
