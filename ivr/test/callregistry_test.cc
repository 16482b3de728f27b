#include "callregistry.h"
#include "fakes.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::shared_ptr<ivr::OngoingCall> makeCall(const std::string &call_id)
{
    return std::make_shared<ivr::OngoingCall>(call_id,
                                              std::make_shared<ivr::test::FakeUserAgent>(call_id),
                                              std::make_shared<ivr::test::FakeServerCall>(),
                                              std::make_shared<ivr::test::FakeAudioPlayer>());
}

} // namespace

TEST(CallRegistryTest, AddOnlyIfAbsent)
{
    ivr::CallRegistry registry;
    auto first = makeCall("a");
    auto second = makeCall("a");

    EXPECT_TRUE(registry.tryAdd("a", first));
    EXPECT_FALSE(registry.tryAdd("a", second));
    EXPECT_EQ(first, registry.find("a"));
    EXPECT_EQ(1u, registry.size());
}

TEST(CallRegistryTest, RemoveReturnsEntryOnce)
{
    ivr::CallRegistry registry;
    auto call = makeCall("a");
    registry.tryAdd("a", call);

    EXPECT_EQ(call, registry.tryRemove("a"));
    EXPECT_EQ(nullptr, registry.tryRemove("a"));
    EXPECT_FALSE(registry.contains("a"));
    EXPECT_EQ(nullptr, registry.tryRemove("never-added"));
}

TEST(CallRegistryTest, ClearHandsBackEverything)
{
    ivr::CallRegistry registry;
    for (int i = 0; i < 40; ++i) {
        registry.tryAdd("call-" + std::to_string(i), makeCall("call-" + std::to_string(i)));
    }

    std::vector<std::string> ids = registry.callIds();
    EXPECT_EQ(40u, ids.size());
    EXPECT_NE(ids.end(), std::find(ids.begin(), ids.end(), "call-17"));

    EXPECT_EQ(40u, registry.clear().size());
    EXPECT_EQ(0u, registry.size());
}

TEST(CallRegistryTest, ConcurrentAddsOfSameIdHaveOneWinner)
{
    ivr::CallRegistry registry;
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&registry, &winners] {
            for (int n = 0; n < 100; ++n) {
                if (registry.tryAdd("shared-" + std::to_string(n), makeCall("shared"))) {
                    ++winners;
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(100, winners.load());
    EXPECT_EQ(100u, registry.size());
}

TEST(CallRegistryTest, ConcurrentRemoveHasOneWinner)
{
    ivr::CallRegistry registry;
    registry.tryAdd("a", makeCall("a"));
    std::atomic<int> removed(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&registry, &removed] {
            if (registry.tryRemove("a")) {
                ++removed;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(1, removed.load());
}

TEST(OngoingCallTest, HangupOnlyOnce)
{
    auto agent = std::make_shared<ivr::test::FakeUserAgent>();
    auto server_call = std::make_shared<ivr::test::FakeServerCall>();
    auto player = std::make_shared<ivr::test::FakeAudioPlayer>();
    ivr::OngoingCall call("a", agent, server_call, player);

    call.hangup();
    call.hangup();

    EXPECT_TRUE(call.isHungUp());
    EXPECT_EQ(1, agent->hangup_count.load());
    EXPECT_EQ(1, server_call->hangup_count.load());
    EXPECT_EQ(1, player->stopCount());
}
