#ifndef _IVRSERVER_H_
#define _IVRSERVER_H_

#include "callmediasession.h"
#include "callregistry.h"
#include "config.h"
#include "incomingcall.h"
#include "ivraccount.h"
#include "logger.h"
#include "requesthandler.h"
#include "requestmodule.h"

#include <pjsua2.hpp>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ivr {

// Owns the pjsua2 endpoint and everything hanging off it: transport,
// account, request module and the calls being handled.
class IvrServer
{
public:
    IvrServer(Logger &logger, const Config &config);
    ~IvrServer();

    IvrServer(const IvrServer &) = delete;
    IvrServer &operator=(const IvrServer &) = delete;

    // Throws pj::Error or SignalingError when the stack cannot be set up.
    void start();
    void stop();

    // Closes and drops the calls that have ended.
    void reap();

    std::size_t activeCalls() const;
    std::vector<std::string> callIds() const;
    std::string accountUri() const;

    const Config &config() const { return config_; }

private:
    class PjLogWriter : public pj::LogWriter
    {
    public:
        explicit PjLogWriter(Logger &logger) :
            logger_(logger) {}

        virtual void write(const pj::LogEntry &entry) override;

    private:
        Logger &logger_;
    };

    void initAudio();
    void createAccount();
    void handleIncomingCall(pj::OnIncomingCallParam &iprm);
    std::shared_ptr<AudioPlayer> makePlayer(const std::shared_ptr<CallMediaSession> &session);
    void reaperLoop();
    bool isIpv6() const;

    Logger &logger_;
    Config config_;
    pj::Endpoint ep_;
    bool started_;

    CallRegistry registry_;
    RequestHandler request_handler_;
    std::unique_ptr<RequestModule> request_module_;
    std::unique_ptr<IvrAccount> account_;

    std::mutex calls_mutex_;
    std::vector<std::shared_ptr<IncomingCall>> calls_;

    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    bool running_;
    std::thread reaper_;
};

} // namespace ivr

#endif // _IVRSERVER_H_
