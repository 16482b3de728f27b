#include "incomingcall.h"
#include "dtmf.h"
#include "fakes.h"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using ivr::test::FakeAudioPlayer;
using ivr::test::FakeMediaSession;
using ivr::test::FakeUserAgent;

namespace {

std::vector<std::string> lines(const std::ostringstream &os)
{
    std::vector<std::string> result;
    std::istringstream in(os.str());
    std::string line;
    while (std::getline(in, line)) {
        result.push_back(line);
    }
    return result;
}

int countLines(const std::ostringstream &os, const std::string &text)
{
    int count = 0;
    for (const auto &line : lines(os)) {
        if (line.find(text) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

class IncomingCallTest : public ::testing::Test
{
protected:
    IncomingCallTest() :
        logger_(out_, err_, ivr::Logger::Level::Info),
        agent_(std::make_shared<FakeUserAgent>()),
        session_(std::make_shared<FakeMediaSession>()),
        player_(std::make_shared<FakeAudioPlayer>())
    {
    }

    std::shared_ptr<ivr::IncomingCall> makeCall()
    {
        return std::make_shared<ivr::IncomingCall>(logger_, registry_, agent_, session_, player_);
    }

    static ivr::SipRequest invite()
    {
        ivr::SipRequest request;
        request.method = "INVITE";
        request.uri = "sip:ivr@192.0.2.1:5060";
        request.call_id = "call-1@192.0.2.10";
        request.from_tag = "a73kszlfl";
        request.local = "192.0.2.1:5060";
        request.source = "192.0.2.10:5060";
        request.call_index = 0;
        return request;
    }

    // Answers a call and lets the greeting finish.
    std::shared_ptr<ivr::IncomingCall> answeredCall()
    {
        auto call = makeCall();
        EXPECT_TRUE(call->handle(invite()));
        call->waitForGreeting();
        return call;
    }

    std::ostringstream out_;
    std::ostringstream err_;
    ivr::Logger logger_;
    ivr::CallRegistry registry_;
    std::shared_ptr<FakeUserAgent> agent_;
    std::shared_ptr<FakeMediaSession> session_;
    std::shared_ptr<FakeAudioPlayer> player_;
};

} // namespace

TEST_F(IncomingCallTest, AnswerRegistersAndPlaysGreeting)
{
    auto call = answeredCall();

    EXPECT_EQ(1, agent_->accept_count.load());
    EXPECT_EQ(1, agent_->answer_count.load());
    EXPECT_TRUE(registry_.contains(agent_->callId()));
    EXPECT_EQ(agent_->callId(), call->callId());
    EXPECT_EQ(ivr::CallState::AwaitingDigits, call->state());
    EXPECT_EQ(std::vector<std::string>({"welcome.wav"}), player_->played());

    call->close();
    ASSERT_FALSE(lines(out_).empty());
    EXPECT_EQ("*** Incoming call request: 192.0.2.1:5060<-192.0.2.10:5060 sip:ivr@192.0.2.1:5060.", lines(out_)[0]);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(IncomingCallTest, CancelledCallEndsQuietly)
{
    agent_->server_call->cancelled = true;
    auto call = makeCall();

    EXPECT_FALSE(call->handle(invite()));
    call->close();

    EXPECT_TRUE(call->isEnded());
    EXPECT_EQ(ivr::CallState::Ended, call->state());
    EXPECT_EQ(0, agent_->answer_count.load());
    EXPECT_EQ(0u, registry_.size());
    EXPECT_TRUE(player_->played().empty());

    std::vector<std::string> logged = lines(out_);
    ASSERT_EQ(2u, logged.size());
    EXPECT_EQ("*** Incoming call cancelled by remote party.", logged[1]);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(IncomingCallTest, DigitsArePlayedBackInOrder)
{
    auto call = answeredCall();

    agent_->fireDtmf(1);
    agent_->fireDtmf(2);
    agent_->fireDtmf(3);
    agent_->fireDtmf(ivr::DTMF_POUND);
    call->flushTones();

    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "one.wav", "two.wav", "three.wav"}), player_->played());
    EXPECT_TRUE(call->keys().empty());
    EXPECT_EQ(ivr::CallState::AwaitingDigits, call->state());

    call->close();
    EXPECT_EQ(1, countLines(out_, "*** User pressed 1!"));
    EXPECT_EQ(1, countLines(out_, "*** User pressed #!"));
    EXPECT_EQ(1, countLines(out_, "*** Cleared the keys pressed"));
    EXPECT_EQ(1, countLines(out_, "received DTMF tone 11, duration 120ms."));
}

TEST_F(IncomingCallTest, EachRoundStartsEmpty)
{
    auto call = answeredCall();

    agent_->fireDtmf(7);
    agent_->fireDtmf(ivr::DTMF_POUND);
    agent_->fireDtmf(0);
    agent_->fireDtmf(ivr::DTMF_POUND);
    call->flushTones();

    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "seven.wav", "zero.wav"}), player_->played());
    call->close();
}

TEST_F(IncomingCallTest, TerminatorWithoutDigitsPlaysNumbersNotFound)
{
    auto call = answeredCall();

    agent_->fireDtmf(ivr::DTMF_POUND);
    call->flushTones();

    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "numbers-not-found.wav"}), player_->played());
    call->close();
}

TEST_F(IncomingCallTest, StarPlaysHelpAndKeepsDigits)
{
    auto call = answeredCall();

    agent_->fireDtmf(4);
    agent_->fireDtmf(ivr::DTMF_STAR);
    call->flushTones();

    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "explanation.wav"}), player_->played());
    EXPECT_EQ("4", call->keys().snapshot());

    agent_->fireDtmf(ivr::DTMF_POUND);
    call->flushTones();
    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "explanation.wav", "four.wav"}), player_->played());
    call->close();
}

TEST_F(IncomingCallTest, TonesDuringGreetingWaitForIt)
{
    player_->blockOn("welcome.wav");
    auto call = makeCall();
    ASSERT_TRUE(call->handle(invite()));
    ASSERT_TRUE(player_->waitUntilBlocked());

    agent_->fireDtmf(5);
    agent_->fireDtmf(ivr::DTMF_POUND);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(ivr::CallState::GreetingPlaying, call->state());
    EXPECT_TRUE(call->keys().empty());
    EXPECT_EQ(std::vector<std::string>({"welcome.wav"}), player_->played());

    player_->release();
    call->waitForGreeting();
    call->flushTones();

    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "five.wav"}), player_->played());
    call->close();
}

TEST_F(IncomingCallTest, UnrecognizedToneIsIgnored)
{
    auto call = answeredCall();

    agent_->fireDtmf(12);
    call->flushTones();

    EXPECT_FALSE(call->isEnded());
    EXPECT_TRUE(call->keys().empty());
    EXPECT_EQ(std::vector<std::string>({"welcome.wav"}), player_->played());

    call->close();
    EXPECT_EQ(1, countLines(err_, "!!! Ignoring unrecognized DTMF tone 12."));
}

TEST_F(IncomingCallTest, HangupStopsPlaybackAndUnregisters)
{
    auto call = answeredCall();
    player_->blockOn("nine.wav");

    agent_->fireDtmf(9);
    agent_->fireDtmf(8);
    agent_->fireDtmf(ivr::DTMF_POUND);
    ASSERT_TRUE(player_->waitUntilBlocked());

    agent_->fireHungUp();
    call->flushTones();

    EXPECT_TRUE(call->isEnded());
    EXPECT_EQ(ivr::CallState::Ended, call->state());
    EXPECT_FALSE(registry_.contains(agent_->callId()));
    EXPECT_TRUE(session_->closed.load());
    EXPECT_GE(player_->stopCount(), 1);
    EXPECT_TRUE(player_->isClosed());
    EXPECT_EQ(1, agent_->hangup_count.load());
    EXPECT_EQ(1, agent_->server_call->hangup_count.load());
    // eight.wav never started.
    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "nine.wav"}), player_->played());

    call->close();
    EXPECT_EQ(1, countLines(out_, "*** Stopped audio"));
}

TEST_F(IncomingCallTest, HangupBeforePlaybackStartsEndsIt)
{
    auto call = answeredCall();
    player_->delayStartOn("nine.wav");
    player_->blockOn("nine.wav");

    agent_->fireDtmf(9);
    agent_->fireDtmf(ivr::DTMF_POUND);
    ASSERT_TRUE(player_->waitUntilStarting());

    agent_->fireHungUp();
    player_->proceed();

    auto flushed = std::async(std::launch::async, [call] { call->flushTones(); });
    bool finished = flushed.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
    if (!finished) {
        player_->release();
    }
    EXPECT_TRUE(finished) << "nine.wav kept playing after the hangup";
    EXPECT_TRUE(player_->isClosed());
    EXPECT_TRUE(call->isEnded());
    call->close();
}

TEST_F(IncomingCallTest, PlaybackRoundsDoNotInterleave)
{
    auto call = answeredCall();
    player_->blockOn("one.wav");

    call->keys().append('1');
    std::thread first([call] { call->playCollectedKeys(); });
    EXPECT_TRUE(player_->waitUntilBlocked());

    call->keys().append('2');
    std::thread second([call] { call->playCollectedKeys(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "one.wav"}), player_->played());

    player_->release();
    first.join();
    second.join();

    EXPECT_EQ(std::vector<std::string>({"welcome.wav", "one.wav", "two.wav"}), player_->played());
    EXPECT_TRUE(call->keys().empty());
    EXPECT_EQ(ivr::CallState::AwaitingDigits, call->state());
    call->close();
}

TEST_F(IncomingCallTest, SecondHangupIsNoOp)
{
    auto call = answeredCall();

    agent_->fireHungUp();
    agent_->fireHungUp();
    call->close();

    EXPECT_EQ(1, agent_->hangup_count.load());
    EXPECT_EQ(1, countLines(out_, "*** Stopped audio"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(IncomingCallTest, TonesAfterHangupAreIgnored)
{
    auto call = answeredCall();

    agent_->fireHungUp();
    agent_->fireDtmf(3);
    agent_->fireDtmf(ivr::DTMF_POUND);
    call->flushTones();

    EXPECT_TRUE(call->keys().empty());
    EXPECT_EQ(std::vector<std::string>({"welcome.wav"}), player_->played());
    call->close();
}

TEST_F(IncomingCallTest, DuplicateRegistrationKeepsOtherEntry)
{
    auto other_agent = std::make_shared<FakeUserAgent>(agent_->callId());
    auto other = std::make_shared<ivr::OngoingCall>(agent_->callId(), other_agent, nullptr,
                                                    std::make_shared<FakeAudioPlayer>());
    ASSERT_TRUE(registry_.tryAdd(agent_->callId(), other));

    auto call = makeCall();
    EXPECT_TRUE(call->handle(invite()));
    call->waitForGreeting();
    EXPECT_EQ(std::vector<std::string>({"welcome.wav"}), player_->played());

    agent_->fireHungUp();
    call->close();

    EXPECT_EQ(other, registry_.find(agent_->callId()));
    EXPECT_FALSE(other->isHungUp());
    EXPECT_EQ(1, countLines(err_, "!!! Could not add call to active calls"));
}

TEST_F(IncomingCallTest, RingTimeoutHangsUp)
{
    auto call = answeredCall();

    agent_->fireRingTimeout();

    EXPECT_TRUE(call->isEnded());
    EXPECT_GE(agent_->hangup_count.load(), 1);
    EXPECT_FALSE(registry_.contains(agent_->callId()));

    call->close();
    EXPECT_EQ(1, countLines(err_,
                            "!!! Incoming call timed out in AwaitingDigits state waiting for client ACK, terminating."));
}

TEST_F(IncomingCallTest, PlaybackFailureTearsCallDown)
{
    player_->failOn("three.wav");
    auto call = answeredCall();

    agent_->fireDtmf(3);
    agent_->fireDtmf(ivr::DTMF_POUND);
    call->flushTones();

    EXPECT_TRUE(call->isEnded());
    EXPECT_FALSE(registry_.contains(agent_->callId()));
    EXPECT_EQ(1, agent_->hangup_count.load());

    call->close();
    EXPECT_EQ(1, countLines(err_, "!!! Tone handling failed: cannot play three.wav"));
}

TEST_F(IncomingCallTest, GreetingFailureTearsCallDown)
{
    player_->failOn("welcome.wav");
    auto call = makeCall();
    EXPECT_TRUE(call->handle(invite()));
    call->waitForGreeting();

    EXPECT_TRUE(call->isEnded());
    EXPECT_EQ(0u, registry_.size());

    call->close();
    EXPECT_EQ(1, countLines(err_, "!!! Greeting playback failed: cannot play welcome.wav"));
}

TEST_F(IncomingCallTest, AnswerFailureEndsCall)
{
    agent_->answer_result = false;
    auto call = makeCall();

    EXPECT_FALSE(call->handle(invite()));
    call->close();

    EXPECT_TRUE(call->isEnded());
    EXPECT_EQ(0u, registry_.size());
    EXPECT_TRUE(player_->played().empty());
    EXPECT_EQ(1, agent_->server_call->hangup_count.load());
    EXPECT_EQ(1, countLines(err_, "!!! Could not answer incoming call, terminating."));
}

TEST_F(IncomingCallTest, AcceptFailureIsLogged)
{
    agent_->accept_throws = true;
    auto call = makeCall();

    EXPECT_FALSE(call->handle(invite()));
    call->close();

    EXPECT_TRUE(call->isEnded());
    EXPECT_EQ(0, agent_->answer_count.load());
    EXPECT_EQ(1, countLines(err_, "!!! Failed to handle incoming call: transaction refused"));
}

TEST_F(IncomingCallTest, HangupWhileAnsweringReleasesCall)
{
    std::weak_ptr<FakeUserAgent> weak_agent = agent_;
    agent_->on_answer = [weak_agent] {
        if (auto agent = weak_agent.lock()) {
            agent->fireHungUp();
        }
    };
    auto call = makeCall();

    EXPECT_FALSE(call->handle(invite()));
    call->close();

    EXPECT_TRUE(call->isEnded());
    EXPECT_EQ(0u, registry_.size());
    EXPECT_TRUE(player_->played().empty());
}

TEST(CallStateTest, Names)
{
    EXPECT_STREQ("Ringing", ivr::toString(ivr::CallState::Ringing));
    EXPECT_STREQ("PlayingDigits", ivr::toString(ivr::CallState::PlayingDigits));
    EXPECT_STREQ("Ended", ivr::toString(ivr::CallState::Ended));
}
