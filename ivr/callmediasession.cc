#include "callmediasession.h"

ivr::CallMediaSession::CallMediaSession() :
    closed_(false)
{
}

ivr::CallMediaSession::~CallMediaSession()
{
}

bool ivr::CallMediaSession::isActive() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_ && media_ != nullptr;
}

void ivr::CallMediaSession::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        media_.reset();
    }
    cv_.notify_all();
}

bool ivr::CallMediaSession::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void ivr::CallMediaSession::attach(const pj::AudioMedia &media)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        media_ = std::make_unique<pj::AudioMedia>(media);
    }
    cv_.notify_all();
}

void ivr::CallMediaSession::detach()
{
    std::lock_guard<std::mutex> lock(mutex_);
    media_.reset();
}

bool ivr::CallMediaSession::waitActive(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || media_ != nullptr; });
    return !closed_ && media_ != nullptr;
}

// pjsua2 calls are made on a copy, outside of our lock: the stack may call
// back into attach()/detach() while holding its own locks.
void ivr::CallMediaSession::startTransmit(pj::AudioMedia &source)
{
    std::unique_ptr<pj::AudioMedia> sink = media();
    if (sink) {
        source.startTransmit(*sink);
    }
}

void ivr::CallMediaSession::stopTransmit(pj::AudioMedia &source)
{
    std::unique_ptr<pj::AudioMedia> sink = media();
    if (sink) {
        source.stopTransmit(*sink);
    }
}

std::unique_ptr<pj::AudioMedia> ivr::CallMediaSession::media() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!media_) {
        return nullptr;
    }
    return std::make_unique<pj::AudioMedia>(*media_);
}
