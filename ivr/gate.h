#ifndef _GATE_H_
#define _GATE_H_

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ivr {

// Single-use latch: closed on construction, opened once, never closed again.
class Gate
{
public:
    Gate();

    void open();
    bool isOpen() const;

    void wait();
    bool waitFor(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_;
};

} // namespace ivr

#endif // _GATE_H_
