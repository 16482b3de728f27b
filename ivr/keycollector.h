#ifndef _KEYCOLLECTOR_H_
#define _KEYCOLLECTOR_H_

#include <cstddef>
#include <mutex>
#include <string>

namespace ivr {

// Keys typed by the caller during one digit-entry round, in arrival order.
class KeyCollector
{
public:
    void append(char key);

    // Returns everything collected so far and leaves the collector empty.
    std::string drainAndClear();

    std::string snapshot() const;
    std::size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::string keys_;
};

} // namespace ivr

#endif // _KEYCOLLECTOR_H_
