#include "mediaplayer.h"
#include "pjthread.h"

#include <memory>
#include <utility>

const std::chrono::milliseconds ivr::MediaPlayer::MEDIA_TIMEOUT(5000);

void ivr::MediaPlayer::FilePlayer::onEof2()
{
    owner_.finished();
}

ivr::MediaPlayer::MediaPlayer(Logger &logger, std::shared_ptr<CallMediaSession> session, std::string sounds_dir) :
    logger_(logger),
    session_(std::move(session)),
    sounds_dir_(std::move(sounds_dir)),
    playing_(false),
    stop_requested_(false),
    eof_(false),
    closed_(false)
{
}

ivr::MediaPlayer::~MediaPlayer()
{
    close();
}

void ivr::MediaPlayer::play(const Sound &sound)
{
    std::lock_guard<std::mutex> play_lock(play_mutex_);
    registerPjThread("ivr-player");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        playing_ = true;
        stop_requested_ = false;
        eof_ = false;
    }

    struct Idle
    {
        MediaPlayer &player;
        ~Idle()
        {
            std::lock_guard<std::mutex> lock(player.mutex_);
            player.playing_ = false;
        }
    } idle{*this};

    if (!session_->waitActive(MEDIA_TIMEOUT)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_->isClosed() || stop_requested_) {
            return;
        }
        throw AudioError("Audio media of the call did not become active");
    }

    const std::string path = joinPath(sounds_dir_, sound.path());
    auto player = std::make_unique<FilePlayer>(*this);
    try {
        player->createPlayer(path, PJMEDIA_FILE_NO_LOOP);
    }
    catch (const pj::Error &err) {
        throw AudioError("Cannot open sound file '" + path + "': " + err.info());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_ || closed_) {
            return;
        }
    }

    try {
        session_->startTransmit(*player);
    }
    catch (const pj::Error &err) {
        throw AudioError("Cannot play '" + path + "' to the call: " + err.info());
    }
    logger_.debug("Playing " + path);

    // The file length bounds the wait in case the end of file is never
    // reported, e.g. when the call's media went away under us.
    auto deadline = std::chrono::steady_clock::now() + sound.duration() + std::chrono::seconds(2);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!eof_ && !stop_requested_ && !closed_) {
            if (cv_.wait_for(lock, std::chrono::milliseconds(100)) == std::cv_status::timeout) {
                if (!session_->isActive() || std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
            }
        }
    }

    try {
        session_->stopTransmit(*player);
    }
    catch (const pj::Error &err) {
        logger_.debug("Error stopping playback of " + path + ": " + err.info());
    }
}

void ivr::MediaPlayer::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!playing_) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();
}

void ivr::MediaPlayer::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        stop_requested_ = true;
    }
    cv_.notify_all();
}

void ivr::MediaPlayer::finished()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        eof_ = true;
    }
    cv_.notify_all();
}
