#include "incomingcall.h"
#include "dtmf.h"
#include "sound.h"

#include <utility>

const char *ivr::toString(CallState state)
{
    switch (state) {
    case CallState::Ringing:
        return "Ringing";
    case CallState::Answering:
        return "Answering";
    case CallState::GreetingPlaying:
        return "GreetingPlaying";
    case CallState::AwaitingDigits:
        return "AwaitingDigits";
    case CallState::PlayingDigits:
        return "PlayingDigits";
    case CallState::Ended:
        return "Ended";
    }
    return "Unknown";
}

ivr::IncomingCall::IncomingCall(Logger &logger,
                                CallRegistry &registry,
                                std::shared_ptr<UserAgent> user_agent,
                                std::shared_ptr<MediaSession> media_session,
                                std::shared_ptr<AudioPlayer> player) :
    logger_(logger),
    registry_(registry),
    user_agent_(std::move(user_agent)),
    media_session_(std::move(media_session)),
    player_(std::move(player)),
    state_(CallState::Ringing),
    ended_(false),
    registered_(false),
    tone_queue_("tones")
{
}

ivr::IncomingCall::~IncomingCall()
{
    close();
}

bool ivr::IncomingCall::handle(const SipRequest &request)
{
    logger_.info("Incoming call request: " + request.local + "<-" + request.source + " " + request.uri + ".");
    subscribe();

    try {
        std::shared_ptr<ServerCall> server_call = user_agent_->acceptCall(request);
        {
            std::lock_guard<std::mutex> lock(call_mutex_);
            server_call_ = server_call;
        }

        // Nothing has been set up yet, so there is nothing to tear down.
        if (server_call->isCancelled()) {
            logger_.info("Incoming call cancelled by remote party.");
            ended_ = true;
            state_ = CallState::Ended;
            greeting_gate_.open();
            return false;
        }

        setState(CallState::Answering);
        if (!user_agent_->answer(*server_call, media_session_)) {
            logger_.warning("Could not answer incoming call, terminating.");
            terminate();
            return false;
        }

        Dialogue dialogue = user_agent_->dialogue();
        auto call = std::make_shared<OngoingCall>(dialogue.call_id, user_agent_, server_call, player_);
        bool registered;
        bool ended;
        {
            std::lock_guard<std::mutex> lock(call_mutex_);
            call_id_ = dialogue.call_id;
            ongoing_ = call;
            registered_ = registry_.tryAdd(call_id_, call);
            registered = registered_;
            ended = ended_.load();
        }

        if (!registered) {
            logger_.warning("Could not add call to active calls");
        }

        // Hung up while we were answering: the hangup found nothing
        // registered yet, so the cleanup is ours.
        if (ended) {
            releaseCall();
            return false;
        }

        setState(CallState::GreetingPlaying);
        greeting_thread_ = std::thread(&IncomingCall::playGreeting, this);
    }
    catch (const std::exception &err) {
        logger_.error(std::string("Failed to handle incoming call: ") + err.what());
        terminate();
        return false;
    }

    return true;
}

void ivr::IncomingCall::onDtmfTone(uint8_t key, int duration_ms)
{
    if (!tone_queue_.post([this, key, duration_ms] { handleTone(key, duration_ms); })) {
        logger_.debug("Dropping DTMF tone " + std::to_string(key) + " for a closed call.");
    }
}

void ivr::IncomingCall::handleTone(uint8_t key, int duration_ms)
{
    greeting_gate_.wait();
    if (ended_) {
        return;
    }

    try {
        logger_.info("Call " + callId() + " received DTMF tone " + std::to_string(key) + ", duration "
                     + std::to_string(duration_ms) + "ms.");

        char pressed;
        if (!toneToKey(key, pressed)) {
            logger_.warning("Ignoring unrecognized DTMF tone " + std::to_string(key) + ".");
            return;
        }

        logger_.info(std::string("User pressed ") + pressed + "!");

        if (pressed == KEY_TERMINATOR) {
            playCollectedKeys();
        }
        else if (pressed == KEY_HELP) {
            playHelp();
        }
        else {
            keys_.append(pressed);
        }
    }
    catch (const std::exception &err) {
        fail(std::string("Tone handling failed: ") + err.what());
    }
}

void ivr::IncomingCall::playCollectedKeys()
{
    std::lock_guard<std::mutex> lock(playback_mutex_);
    setState(CallState::PlayingDigits);

    std::string pressed = keys_.drainAndClear();
    logger_.info("Cleared the keys pressed");

    if (pressed.empty()) {
        playSound(sounds::numbersNotFound());
    }
    else {
        for (char key : pressed) {
            const Sound *sound = sounds::forDigit(key);
            if (sound == nullptr) {
                continue;
            }
            if (!playSound(*sound)) {
                break;
            }
        }
    }

    setState(CallState::AwaitingDigits);
}

void ivr::IncomingCall::onHangup(const Dialogue &dialogue)
{
    logger_.debug("Call " + dialogue.call_id + " hung up.");
    terminate();
}

void ivr::IncomingCall::onRingTimeout()
{
    if (ended_) {
        return;
    }

    logger_.warning(std::string("Incoming call timed out in ") + toString(state())
                    + " state waiting for client ACK, terminating.");
    user_agent_->hangup();
    terminate();
}

void ivr::IncomingCall::close()
{
    terminate();

    if (greeting_thread_.joinable()) {
        if (greeting_thread_.get_id() == std::this_thread::get_id()) {
            greeting_thread_.detach();
        }
        else {
            greeting_thread_.join();
        }
    }
    tone_queue_.shutdown();
    user_agent_->clearHandlers();
}

std::string ivr::IncomingCall::callId() const
{
    std::lock_guard<std::mutex> lock(call_mutex_);
    return call_id_;
}

void ivr::IncomingCall::waitForGreeting()
{
    greeting_gate_.wait();
}

void ivr::IncomingCall::flushTones()
{
    tone_queue_.waitIdle();
}

void ivr::IncomingCall::subscribe()
{
    std::weak_ptr<IncomingCall> weak = shared_from_this();

    user_agent_->setOnCallHungUp([weak](const Dialogue &dialogue) {
        if (auto self = weak.lock()) {
            self->onHangup(dialogue);
        }
    });
    user_agent_->setOnDtmfTone([weak](uint8_t key, int duration_ms) {
        if (auto self = weak.lock()) {
            self->onDtmfTone(key, duration_ms);
        }
    });
    user_agent_->setOnRingTimeout([weak]() {
        if (auto self = weak.lock()) {
            self->onRingTimeout();
        }
    });
}

void ivr::IncomingCall::playGreeting()
{
    try {
        playSound(sounds::welcome());
    }
    catch (const std::exception &err) {
        fail(std::string("Greeting playback failed: ") + err.what());
    }

    setState(CallState::AwaitingDigits);
    greeting_gate_.open();
}

void ivr::IncomingCall::playHelp()
{
    std::lock_guard<std::mutex> lock(playback_mutex_);
    playSound(sounds::explanation());
}

bool ivr::IncomingCall::playSound(const Sound &sound)
{
    if (ended_) {
        return false;
    }
    player_->play(sound);
    return !ended_;
}

void ivr::IncomingCall::setState(CallState state)
{
    CallState current = state_.load();
    while (current != CallState::Ended && !state_.compare_exchange_weak(current, state)) {
    }
}

// First caller wins; everything after that is a no-op.
bool ivr::IncomingCall::terminate()
{
    if (ended_.exchange(true)) {
        return false;
    }
    state_ = CallState::Ended;

    releaseCall();
    player_->close();
    media_session_->close();
    greeting_gate_.open();

    logger_.info("Stopped audio");
    return true;
}

void ivr::IncomingCall::releaseCall()
{
    std::shared_ptr<OngoingCall> call;
    std::shared_ptr<ServerCall> server_call;
    std::string call_id;
    bool registered;
    {
        std::lock_guard<std::mutex> lock(call_mutex_);
        call.swap(ongoing_);
        server_call.swap(server_call_);
        call_id = call_id_;
        registered = registered_;
        registered_ = false;
    }

    if (registered) {
        registry_.tryRemove(call_id);
    }

    if (call) {
        call->hangup();
    }
    else {
        user_agent_->hangup();
        if (server_call) {
            server_call->hangup();
        }
    }
}

void ivr::IncomingCall::fail(const std::string &what)
{
    logger_.error(what);
    terminate();
}
