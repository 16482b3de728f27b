#ifndef _CALLMEDIASESSION_H_
#define _CALLMEDIASESSION_H_

#include "mediasession.h"

#include <pjsua2.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace ivr {

// The audio media of one pjsua2 call, available once the SDP negotiation
// is done and the call's media is active.
class CallMediaSession : public MediaSession
{
public:
    CallMediaSession();
    ~CallMediaSession();

    virtual bool isActive() const override;
    virtual void close() override;
    bool isClosed() const;

    void attach(const pj::AudioMedia &media);
    void detach();

    // Returns true once media is attached, false on timeout or close().
    bool waitActive(std::chrono::milliseconds timeout);

    // Connects source to the call's audio. Throws pj::Error.
    void startTransmit(pj::AudioMedia &source);
    void stopTransmit(pj::AudioMedia &source);

private:
    std::unique_ptr<pj::AudioMedia> media() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<pj::AudioMedia> media_;
    bool closed_;
};

} // namespace ivr

#endif // _CALLMEDIASESSION_H_
