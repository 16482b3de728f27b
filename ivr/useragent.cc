#include "useragent.h"

#include <utility>

void ivr::UserAgent::setOnCallHungUp(HungUpHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    on_hung_up_ = std::move(handler);
}

void ivr::UserAgent::setOnDtmfTone(DtmfToneHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    on_dtmf_tone_ = std::move(handler);
}

void ivr::UserAgent::setOnRingTimeout(RingTimeoutHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    on_ring_timeout_ = std::move(handler);
}

void ivr::UserAgent::clearHandlers()
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    on_hung_up_ = nullptr;
    on_dtmf_tone_ = nullptr;
    on_ring_timeout_ = nullptr;
}

// Handlers run outside the lock so they may call back into the agent.
void ivr::UserAgent::notifyCallHungUp(const Dialogue &dialogue)
{
    HungUpHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = on_hung_up_;
    }
    if (handler) {
        handler(dialogue);
    }
}

void ivr::UserAgent::notifyDtmfTone(uint8_t key, int duration_ms)
{
    DtmfToneHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = on_dtmf_tone_;
    }
    if (handler) {
        handler(key, duration_ms);
    }
}

void ivr::UserAgent::notifyRingTimeout()
{
    RingTimeoutHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = on_ring_timeout_;
    }
    if (handler) {
        handler();
    }
}
