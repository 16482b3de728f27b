#ifndef _DEVICEPLAYER_H_
#define _DEVICEPLAYER_H_

#include "audioplayer.h"
#include "logger.h"

#include <portaudio.h>
#include <sndfile.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>

namespace ivr {

// Plays sounds on the local default output device with libsndfile and
// PortAudio instead of sending them down the call.
class DevicePlayer : public AudioPlayer
{
public:
    static const unsigned long FRAMES_PER_BUFFER = 256;

    DevicePlayer(Logger &logger, std::string sounds_dir);
    ~DevicePlayer();

    DevicePlayer(const DevicePlayer &) = delete;
    DevicePlayer &operator=(const DevicePlayer &) = delete;

    virtual void play(const Sound &sound) override;
    virtual void stop() override;
    virtual void close() override;

private:
    static int streamCallback(const void *input,
                              void *output,
                              unsigned long frames,
                              const PaStreamCallbackTimeInfo *time_info,
                              PaStreamCallbackFlags status_flags,
                              void *user_data);
    static void streamFinished(void *user_data);

    Logger &logger_;
    std::string sounds_dir_;

    std::mutex play_mutex_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool playing_;
    bool closed_;
    bool finished_;

    SNDFILE *file_;
    int channels_;
    std::atomic<bool> stop_requested_; // read by the stream callback
};

} // namespace ivr

#endif // _DEVICEPLAYER_H_
