#include "gate.h"

ivr::Gate::Gate() :
    open_(false)
{
}

void ivr::Gate::open()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_) {
            return;
        }
        open_ = true;
    }
    cv_.notify_all();
}

bool ivr::Gate::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void ivr::Gate::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return open_; });
}

bool ivr::Gate::waitFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return open_; });
}
