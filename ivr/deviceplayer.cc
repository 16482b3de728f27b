#include "deviceplayer.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

namespace {

struct SndFileCloser
{
    void operator()(SNDFILE *file) const
    {
        sf_close(file);
    }
};

std::string paError(const std::string &what, PaError err)
{
    return what + ": " + Pa_GetErrorText(err);
}

} // namespace

const unsigned long ivr::DevicePlayer::FRAMES_PER_BUFFER;

ivr::DevicePlayer::DevicePlayer(Logger &logger, std::string sounds_dir) :
    logger_(logger),
    sounds_dir_(std::move(sounds_dir)),
    playing_(false),
    closed_(false),
    finished_(false),
    file_(nullptr),
    channels_(0),
    stop_requested_(false)
{
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw AudioError(paError("PortAudio initialization failed", err));
    }
}

ivr::DevicePlayer::~DevicePlayer()
{
    close();
    std::lock_guard<std::mutex> play_lock(play_mutex_);
    Pa_Terminate();
}

void ivr::DevicePlayer::play(const Sound &sound)
{
    std::lock_guard<std::mutex> play_lock(play_mutex_);

    // From here on a stop() is kept until this play() returns.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        playing_ = true;
        finished_ = false;
        stop_requested_ = false;
    }

    struct Idle
    {
        DevicePlayer &player;
        ~Idle()
        {
            std::lock_guard<std::mutex> lock(player.mutex_);
            player.playing_ = false;
            player.file_ = nullptr;
        }
    } idle{*this};

    const std::string path = joinPath(sounds_dir_, sound.path());
    SF_INFO sfinfo;
    sfinfo.format = 0;
    std::unique_ptr<SNDFILE, SndFileCloser> file(sf_open(path.c_str(), SFM_READ, &sfinfo));
    if (!file) {
        throw AudioError("Failed to open audio file '" + path + "': " + sf_strerror(nullptr));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ = file.get();
        channels_ = sfinfo.channels;
    }

    PaStream *stream = nullptr;
    PaError err = Pa_OpenDefaultStream(&stream, 0, sfinfo.channels, paFloat32, sfinfo.samplerate,
                                       FRAMES_PER_BUFFER, &DevicePlayer::streamCallback, this);
    if (err != paNoError) {
        throw AudioError(paError("Failed to open PortAudio stream", err));
    }

    err = Pa_SetStreamFinishedCallback(stream, &DevicePlayer::streamFinished);
    if (err == paNoError) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
            Pa_CloseStream(stream);
            return;
        }
        err = Pa_StartStream(stream);
    }
    if (err != paNoError) {
        Pa_CloseStream(stream);
        throw AudioError(paError("Failed to start PortAudio stream", err));
    }
    logger_.debug("Playing " + path + " on the output device");

    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return finished_ || stop_requested_.load(); });
    }

    err = stop_requested_ ? Pa_AbortStream(stream) : Pa_StopStream(stream);
    if (err != paNoError && err != paStreamIsStopped) {
        logger_.debug(paError("Error stopping PortAudio stream", err));
    }
    err = Pa_CloseStream(stream);
    if (err != paNoError) {
        logger_.debug(paError("Error closing PortAudio stream", err));
    }
}

void ivr::DevicePlayer::stop()
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

void ivr::DevicePlayer::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        stop_requested_ = true;
    }
    cv_.notify_all();
}

int ivr::DevicePlayer::streamCallback(const void *input,
                                      void *output,
                                      unsigned long frames,
                                      const PaStreamCallbackTimeInfo *time_info,
                                      PaStreamCallbackFlags status_flags,
                                      void *user_data)
{
    (void)input;
    (void)time_info;
    (void)status_flags;

    DevicePlayer *player = static_cast<DevicePlayer *>(user_data);
    float *out = static_cast<float *>(output);
    if (player->stop_requested_) {
        return paAbort;
    }

    sf_count_t read = sf_readf_float(player->file_, out, static_cast<sf_count_t>(frames));
    if (read < 0) {
        read = 0;
    }
    if (read < static_cast<sf_count_t>(frames)) {
        std::fill(out + read * player->channels_, out + frames * player->channels_, 0.0f);
        return paComplete;
    }
    return paContinue;
}

void ivr::DevicePlayer::streamFinished(void *user_data)
{
    DevicePlayer *player = static_cast<DevicePlayer *>(user_data);
    {
        std::lock_guard<std::mutex> lock(player->mutex_);
        player->finished_ = true;
    }
    player->cv_.notify_all();
}
