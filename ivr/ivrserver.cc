#include "ivrserver.h"
#include "deviceplayer.h"
#include "mediaplayer.h"
#include "pjthread.h"
#include "pjuseragent.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>
#include <utility>

void ivr::IvrServer::PjLogWriter::write(const pj::LogEntry &entry)
{
    std::string msg = entry.msg;
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }

    if (entry.level <= 1) {
        logger_.error(msg);
    }
    else if (entry.level == 2) {
        logger_.warning(msg);
    }
    else {
        logger_.debug(msg);
    }
}

ivr::IvrServer::IvrServer(Logger &logger, const Config &config) :
    logger_(logger),
    config_(config),
    started_(false),
    request_handler_(logger),
    running_(false)
{
}

ivr::IvrServer::~IvrServer()
{
    stop();
}

void ivr::IvrServer::start()
{
    logger_.debug("Initializing Endpoint...");
    ep_.libCreate();
    started_ = true;

    pj::EpConfig ep_cfg;
    ep_cfg.uaConfig.userAgent = IVR_USER_AGENT;
    ep_cfg.logConfig.writer = new PjLogWriter(logger_); // owned by the endpoint
    ep_cfg.logConfig.decor &= ~PJ_LOG_HAS_NEWLINE;
    ep_cfg.logConfig.level = config_.log_level == Logger::Level::Debug ? 5 : 3;
    ep_cfg.logConfig.consoleLevel = ep_cfg.logConfig.level;
    ep_.libInit(ep_cfg);

    pj::TransportConfig tcfg;
    tcfg.port = static_cast<unsigned>(config_.port);
    tcfg.boundAddress = config_.address;
    ep_.transportCreate(isIpv6() ? PJSIP_TRANSPORT_UDP6 : PJSIP_TRANSPORT_UDP, tcfg);

    ep_.libStart();
    logger_.debug("Pjsua2 library start");

    initAudio();

    request_module_ = std::make_unique<RequestModule>(logger_, request_handler_);
    request_module_->registerModule(pjsua_get_pjsip_endpt());

    createAccount();

    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        running_ = true;
    }
    reaper_ = std::thread(&IvrServer::reaperLoop, this);
}

void ivr::IvrServer::stop()
{
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        running_ = false;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable()) {
        reaper_.join();
    }

    if (!started_) {
        return;
    }

    std::vector<std::shared_ptr<OngoingCall>> ongoing = registry_.clear();
    if (!ongoing.empty()) {
        logger_.debug("Hanging up " + std::to_string(ongoing.size()) + " active call(s) before exit...");
        for (auto &call : ongoing) {
            call->hangup();
        }
        pj_thread_sleep(500);
    }

    std::vector<std::shared_ptr<IncomingCall>> calls;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls.swap(calls_);
    }
    for (auto &call : calls) {
        call->close();
    }
    calls.clear();

    try {
        account_.reset();
        request_module_.reset();
        ep_.libDestroy();
        logger_.debug("Pjsua2 library destroy");
    }
    catch (const pj::Error &err) {
        logger_.error("Error destroying the library: " + err.info());
    }
    started_ = false;
}

void ivr::IvrServer::reap()
{
    std::vector<std::shared_ptr<IncomingCall>> ended;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = std::partition(calls_.begin(), calls_.end(),
                                 [](const std::shared_ptr<IncomingCall> &call) { return !call->isEnded(); });
        ended.assign(std::make_move_iterator(it), std::make_move_iterator(calls_.end()));
        calls_.erase(it, calls_.end());
    }

    for (auto &call : ended) {
        logger_.debug("Cleaning up ended call " + call->callId());
        call->close();
    }
}

std::size_t ivr::IvrServer::activeCalls() const
{
    return registry_.size();
}

std::vector<std::string> ivr::IvrServer::callIds() const
{
    return registry_.callIds();
}

std::string ivr::IvrServer::accountUri() const
{
    if (config_.registers()) {
        return "sip:" + config_.user + "@" + config_.domain;
    }
    std::string host = isIpv6() ? "[" + config_.address + "]" : config_.address;
    return "sip:ivr@" + host + ":" + std::to_string(config_.port);
}

void ivr::IvrServer::initAudio()
{
    try {
        pj::AudDevManager &mgr = ep_.audDevManager();
        if (config_.null_audio) {
            logger_.debug("Using NULL audio device.");
            mgr.setNullDev();
        }
        else if (mgr.getDevCount() > 0) {
            logger_.debug("Default capture device: " + std::to_string(mgr.getCaptureDev()));
            logger_.debug("Default playback device: " + std::to_string(mgr.getPlaybackDev()));
        }
        else {
            logger_.warning("No audio devices found. Using NULL audio device.");
            mgr.setNullDev();
        }
    }
    catch (const pj::Error &err) {
        logger_.error("Error setting audio devices: " + err.info());
        ep_.audDevManager().setNullDev();
    }
}

void ivr::IvrServer::createAccount()
{
    pj::AccountConfig acc_cfg;
    acc_cfg.idUri = accountUri();
    if (config_.registers()) {
        acc_cfg.regConfig.registrarUri = "sip:" + config_.domain;
        acc_cfg.regConfig.timeoutSec = config_.reg_expiry;
        pj::AuthCredInfo cred("digest", "*", config_.user, 0, config_.password);
        acc_cfg.sipConfig.authCreds.push_back(cred);
    }
    if (isIpv6()) {
        acc_cfg.mediaConfig.ipv6Use = PJSUA_IPV6_ENABLED;
    }

    account_ = std::make_unique<IvrAccount>(logger_, [this](pj::OnIncomingCallParam &iprm) { handleIncomingCall(iprm); });
    account_->create(acc_cfg);
    logger_.info("Account created for " + acc_cfg.idUri
                 + (config_.registers() ? ". Registering..." : "."));
}

void ivr::IvrServer::handleIncomingCall(pj::OnIncomingCallParam &iprm)
{
    SipRequest request;
    pjsip_rx_data *rdata = static_cast<pjsip_rx_data *>(iprm.rdata.pjRxData);
    if (rdata) {
        request = RequestModule::toSipRequest(rdata);
    }
    else {
        request.method = "INVITE";
        request.source = iprm.rdata.srcAddress;
    }
    request.call_index = iprm.callId;

    std::shared_ptr<PjUserAgent> agent;
    try {
        agent = std::make_shared<PjUserAgent>(logger_, *account_, iprm.callId);
        std::shared_ptr<CallMediaSession> session = std::make_shared<CallMediaSession>();
        std::shared_ptr<IncomingCall> call =
            std::make_shared<IncomingCall>(logger_, registry_, agent, session, makePlayer(session));
        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            calls_.push_back(call);
        }
        call->handle(request);
    }
    catch (const pj::Error &err) {
        logger_.error("Failed to set up incoming call " + std::to_string(iprm.callId) + ": " + err.info());
        if (agent) {
            agent->hangup();
        }
    }
    catch (const std::exception &e) {
        logger_.error("Failed to set up incoming call " + std::to_string(iprm.callId) + ": " + e.what());
        if (agent) {
            agent->hangup();
        }
    }
}

std::shared_ptr<ivr::AudioPlayer> ivr::IvrServer::makePlayer(const std::shared_ptr<CallMediaSession> &session)
{
    if (config_.audio_output == AudioOutput::Device) {
        return std::make_shared<DevicePlayer>(logger_, config_.sounds_dir);
    }
    return std::make_shared<MediaPlayer>(logger_, session, config_.sounds_dir);
}

void ivr::IvrServer::reaperLoop()
{
    registerPjThread("ivr-reaper");
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (running_) {
        reaper_cv_.wait_for(lock, std::chrono::seconds(1));
        if (!running_) {
            break;
        }
        lock.unlock();
        reap();
        lock.lock();
    }
}

bool ivr::IvrServer::isIpv6() const
{
    return config_.address.find(':') != std::string::npos;
}
