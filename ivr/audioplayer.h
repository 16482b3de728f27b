#ifndef _AUDIOPLAYER_H_
#define _AUDIOPLAYER_H_

#include "sound.h"

#include <stdexcept>
#include <string>

namespace ivr {

class AudioError : public std::runtime_error
{
public:
    explicit AudioError(const std::string &what) :
        std::runtime_error(what) {}
};

class AudioPlayer
{
public:
    virtual ~AudioPlayer() {}

    // Blocks until the sound has been played completely or stop() is
    // called. Throws AudioError when the sound or the device is unusable.
    virtual void
    play(const Sound &sound) = 0;

    // Makes an in-flight play() return early. No effect when idle.
    virtual void
    stop() = 0;

    // Like stop(), but also makes every later play() return at once,
    // including one that has been entered but not started yet. Final.
    virtual void
    close() = 0;
};

} // namespace ivr

#endif // _AUDIOPLAYER_H_
