#include "callregistry.h"

#include <functional>
#include <utility>

const std::size_t ivr::CallRegistry::STRIPES;

bool ivr::CallRegistry::tryAdd(const std::string &call_id, std::shared_ptr<OngoingCall> call)
{
    Stripe &stripe = stripeFor(call_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    return stripe.calls.emplace(call_id, std::move(call)).second;
}

std::shared_ptr<ivr::OngoingCall> ivr::CallRegistry::tryRemove(const std::string &call_id)
{
    Stripe &stripe = stripeFor(call_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto it = stripe.calls.find(call_id);
    if (it == stripe.calls.end()) {
        return nullptr;
    }
    std::shared_ptr<OngoingCall> call = std::move(it->second);
    stripe.calls.erase(it);
    return call;
}

std::shared_ptr<ivr::OngoingCall> ivr::CallRegistry::find(const std::string &call_id) const
{
    const Stripe &stripe = stripeFor(call_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto it = stripe.calls.find(call_id);
    return it == stripe.calls.end() ? nullptr : it->second;
}

bool ivr::CallRegistry::contains(const std::string &call_id) const
{
    const Stripe &stripe = stripeFor(call_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    return stripe.calls.count(call_id) != 0;
}

std::size_t ivr::CallRegistry::size() const
{
    std::size_t total = 0;
    for (const auto &stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe.mutex);
        total += stripe.calls.size();
    }
    return total;
}

std::vector<std::string> ivr::CallRegistry::callIds() const
{
    std::vector<std::string> ids;
    for (const auto &stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe.mutex);
        for (const auto &entry : stripe.calls) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

std::vector<std::shared_ptr<ivr::OngoingCall>> ivr::CallRegistry::clear()
{
    std::vector<std::shared_ptr<OngoingCall>> removed;
    for (auto &stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe.mutex);
        for (auto &entry : stripe.calls) {
            removed.push_back(std::move(entry.second));
        }
        stripe.calls.clear();
    }
    return removed;
}

ivr::CallRegistry::Stripe &ivr::CallRegistry::stripeFor(const std::string &call_id)
{
    return stripes_[std::hash<std::string>()(call_id) % STRIPES];
}

const ivr::CallRegistry::Stripe &ivr::CallRegistry::stripeFor(const std::string &call_id) const
{
    return stripes_[std::hash<std::string>()(call_id) % STRIPES];
}
