#ifndef _CALLREGISTRY_H_
#define _CALLREGISTRY_H_

#include "ongoingcall.h"

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ivr {

// Calls in progress keyed by SIP Call-ID, shared by every call handler.
// Keys are spread over independently locked stripes.
class CallRegistry
{
public:
    static const std::size_t STRIPES = 16;

    // Inserts only if call_id is not present yet.
    bool tryAdd(const std::string &call_id, std::shared_ptr<OngoingCall> call);

    // Removes and returns the entry, nullptr when there is none.
    std::shared_ptr<OngoingCall> tryRemove(const std::string &call_id);

    std::shared_ptr<OngoingCall> find(const std::string &call_id) const;
    bool contains(const std::string &call_id) const;

    std::size_t size() const;
    std::vector<std::string> callIds() const;

    // Empties the registry, handing back what was in it.
    std::vector<std::shared_ptr<OngoingCall>> clear();

private:
    struct Stripe
    {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<OngoingCall>> calls;
    };

    Stripe &stripeFor(const std::string &call_id);
    const Stripe &stripeFor(const std::string &call_id) const;

    std::array<Stripe, STRIPES> stripes_;
};

} // namespace ivr

#endif // _CALLREGISTRY_H_
