#ifndef _MEDIAPLAYER_H_
#define _MEDIAPLAYER_H_

#include "audioplayer.h"
#include "callmediasession.h"
#include "logger.h"

#include <pjsua2.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace ivr {

// Plays WAV files into the audio media of a call through the pjsua2
// conference bridge.
class MediaPlayer : public AudioPlayer
{
public:
    // How long play() waits for the call's media to come up.
    static const std::chrono::milliseconds MEDIA_TIMEOUT;

    MediaPlayer(Logger &logger, std::shared_ptr<CallMediaSession> session, std::string sounds_dir);
    ~MediaPlayer();

    virtual void play(const Sound &sound) override;
    virtual void stop() override;
    virtual void close() override;

private:
    class FilePlayer : public pj::AudioMediaPlayer
    {
    public:
        explicit FilePlayer(MediaPlayer &owner) :
            owner_(owner) {}

        virtual void onEof2() override;

    private:
        MediaPlayer &owner_;
    };

    void finished();

    Logger &logger_;
    std::shared_ptr<CallMediaSession> session_;
    std::string sounds_dir_;

    std::mutex play_mutex_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool playing_;
    bool stop_requested_;
    bool eof_;
    bool closed_;
};

} // namespace ivr

#endif // _MEDIAPLAYER_H_
