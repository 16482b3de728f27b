#include "keycollector.h"

void ivr::KeyCollector::append(char key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.push_back(key);
}

std::string ivr::KeyCollector::drainAndClear()
{
    std::string drained;
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(keys_);
    return drained;
}

std::string ivr::KeyCollector::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_;
}

std::size_t ivr::KeyCollector::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

bool ivr::KeyCollector::empty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.empty();
}
