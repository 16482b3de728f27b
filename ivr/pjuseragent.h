#ifndef _PJUSERAGENT_H_
#define _PJUSERAGENT_H_

#include "callmediasession.h"
#include "ivrcall.h"
#include "logger.h"
#include "useragent.h"

#include <pjsua2.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace ivr {

// UserAgent on top of a pjsua2 incoming call. Must be created from
// Account::onIncomingCall() with the call id pjsua handed over.
class PjUserAgent : public UserAgent, public std::enable_shared_from_this<PjUserAgent>
{
public:
    PjUserAgent(Logger &logger, pj::Account &account, int call_index);
    ~PjUserAgent();

    virtual std::shared_ptr<ServerCall> acceptCall(const SipRequest &request) override;
    virtual bool answer(ServerCall &call, const std::shared_ptr<MediaSession> &session) override;
    virtual Dialogue dialogue() const override;
    virtual bool isCallActive() const override;
    virtual void hangup() override;

    bool isDisconnected() const { return disconnected_.load(); }
    std::string localUri() const;
    Logger &logger() { return logger_; }

    // Forwarded by IvrCall from pjsua2 callbacks.
    void callStateChanged(const pj::CallInfo &ci);
    void mediaActivated(const pj::AudioMedia &media);
    void mediaDeactivated();
    void digitReceived(const std::string &digit, unsigned duration);

private:
    std::shared_ptr<CallMediaSession> session() const;

    Logger &logger_;
    std::unique_ptr<IvrCall> call_;

    mutable std::mutex mutex_;
    std::string call_id_;
    std::string remote_uri_;
    std::string local_uri_;
    std::shared_ptr<CallMediaSession> session_;

    std::atomic<bool> answered_;
    std::atomic<bool> confirmed_;
    std::atomic<bool> disconnected_;
    std::atomic<bool> hangup_sent_;
};

// The INVITE server transaction of a PjUserAgent.
class PjServerCall : public ServerCall
{
public:
    explicit PjServerCall(std::shared_ptr<PjUserAgent> agent);

    virtual bool isCancelled() const override;
    virtual void hangup() override;

private:
    std::shared_ptr<PjUserAgent> agent_;
};

} // namespace ivr

#endif // _PJUSERAGENT_H_
