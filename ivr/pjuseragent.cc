#include "pjuseragent.h"
#include "dtmf.h"
#include "pjthread.h"

#include <memory>
#include <utility>

ivr::PjUserAgent::PjUserAgent(Logger &logger, pj::Account &account, int call_index) :
    logger_(logger),
    answered_(false),
    confirmed_(false),
    disconnected_(false),
    hangup_sent_(false)
{
    call_ = std::make_unique<IvrCall>(*this, account, call_index);
    try {
        pj::CallInfo ci = call_->getInfo();
        call_id_ = ci.callIdString;
        remote_uri_ = ci.remoteUri;
        local_uri_ = ci.localUri;
    }
    catch (const pj::Error &err) {
        logger_.warning("Could not read info of call " + std::to_string(call_index) + ": " + err.info());
    }
}

ivr::PjUserAgent::~PjUserAgent()
{
    clearHandlers();
    try {
        registerPjThread("ivr-agent");
        call_.reset();
    }
    catch (const pj::Error &err) {
        logger_.error("Error destroying call object: " + err.info());
    }
}

std::shared_ptr<ivr::ServerCall> ivr::PjUserAgent::acceptCall(const SipRequest &request)
{
    PJ_UNUSED_ARG(request);
    try {
        registerPjThread("ivr-agent");
        pj::CallOpParam prm;
        prm.statusCode = PJSIP_SC_RINGING;
        call_->answer(prm);
    }
    catch (const pj::Error &err) {
        throw SignalingError("Failed to accept call " + call_id_ + ": " + err.info());
    }
    return std::make_shared<PjServerCall>(shared_from_this());
}

bool ivr::PjUserAgent::answer(ServerCall &call, const std::shared_ptr<MediaSession> &session)
{
    PJ_UNUSED_ARG(call);
    std::shared_ptr<CallMediaSession> media = std::dynamic_pointer_cast<CallMediaSession>(session);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = media;
    }
    if (!media) {
        logger_.warning("Answering call " + call_id_ + " without a pjsua2 media session");
    }

    try {
        registerPjThread("ivr-agent");
        pj::CallOpParam prm;
        prm.statusCode = PJSIP_SC_OK;
        call_->answer(prm);
        answered_ = true;
    }
    catch (const pj::Error &err) {
        logger_.error("Failed to answer call " + call_id_ + ": " + err.info());
        return false;
    }
    return true;
}

ivr::Dialogue ivr::PjUserAgent::dialogue() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    Dialogue dialogue;
    dialogue.call_id = call_id_;
    dialogue.remote_uri = remote_uri_;
    return dialogue;
}

bool ivr::PjUserAgent::isCallActive() const
{
    if (disconnected_) {
        return false;
    }
    try {
        registerPjThread("ivr-agent");
        return call_->isActive();
    }
    catch (const pj::Error &err) {
        logger_.error("Error checking call " + call_id_ + ": " + err.info());
        return false;
    }
}

void ivr::PjUserAgent::hangup()
{
    if (disconnected_ || hangup_sent_.exchange(true)) {
        return;
    }

    try {
        registerPjThread("ivr-agent");
        pj::CallOpParam prm;
        if (!answered_) {
            prm.statusCode = PJSIP_SC_DECLINE;
        }
        call_->hangup(prm);
    }
    catch (const pj::Error &err) {
        // The stack may have ended the call on its own in the meantime.
        logger_.debug("Hangup of call " + call_id_ + " failed: " + err.info());
    }
}

std::string ivr::PjUserAgent::localUri() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return local_uri_;
}

void ivr::PjUserAgent::callStateChanged(const pj::CallInfo &ci)
{
    std::string text = "Call " + std::to_string(ci.id) + " state: " + ci.stateText;
    if (!ci.lastReason.empty()) {
        text += " (reason: " + ci.lastReason + ")";
    }
    logger_.debug(text);

    if (ci.state == PJSIP_INV_STATE_CONFIRMED) {
        confirmed_ = true;
        logger_.debug("Call " + std::to_string(ci.id) + " connected/confirmed.");
        return;
    }

    if (ci.state != PJSIP_INV_STATE_DISCONNECTED || disconnected_.exchange(true)) {
        return;
    }

    logger_.debug("Call " + std::to_string(ci.id) + " disconnected.");
    mediaDeactivated();

    // A 200 OK that never got its ACK.
    if (answered_ && !confirmed_ && ci.lastStatusCode == PJSIP_SC_REQUEST_TIMEOUT) {
        notifyRingTimeout();
    }

    Dialogue dialogue;
    dialogue.call_id = ci.callIdString;
    dialogue.remote_uri = ci.remoteUri;
    notifyCallHungUp(dialogue);
}

void ivr::PjUserAgent::mediaActivated(const pj::AudioMedia &media)
{
    std::shared_ptr<CallMediaSession> current = session();
    if (current) {
        current->attach(media);
        logger_.debug("Audio media is active for call " + call_id_);
    }
}

void ivr::PjUserAgent::mediaDeactivated()
{
    std::shared_ptr<CallMediaSession> current = session();
    if (current) {
        current->detach();
    }
}

void ivr::PjUserAgent::digitReceived(const std::string &digit, unsigned duration)
{
    uint8_t tone;
    if (digit.empty() || !keyToTone(digit[0], tone)) {
        logger_.warning("Call " + call_id_ + " received unknown DTMF digit '" + digit + "'");
        return;
    }

    int duration_ms = duration == PJSUA_UNKNOWN_DTMF_DURATION ? 0 : static_cast<int>(duration);
    notifyDtmfTone(tone, duration_ms);
}

std::shared_ptr<ivr::CallMediaSession> ivr::PjUserAgent::session() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

ivr::PjServerCall::PjServerCall(std::shared_ptr<PjUserAgent> agent) :
    agent_(std::move(agent))
{
}

bool ivr::PjServerCall::isCancelled() const
{
    return agent_->isDisconnected();
}

void ivr::PjServerCall::hangup()
{
    agent_->hangup();
}
