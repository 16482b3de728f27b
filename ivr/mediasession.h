#ifndef _MEDIASESSION_H_
#define _MEDIASESSION_H_

namespace ivr {

// Per-call media endpoint handed to UserAgent::answer().
class MediaSession
{
public:
    virtual ~MediaSession() {}

    virtual bool
    isActive() const = 0;

    // Detaches from the call for good; wakes anyone waiting for media.
    virtual void
    close() = 0;
};

} // namespace ivr

#endif // _MEDIASESSION_H_
