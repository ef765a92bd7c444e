#include "rtc_engine.hpp"

#include "fakes.hpp"

#include <rtc/rtc.hpp>

#include <gtest/gtest.h>

#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace huddle {
namespace {

using namespace std::chrono_literals;
using fakes::WaitFor;

// Events are collected into shared state so that a late emit after the test
// body returns still has somewhere to go.
struct EventLog {
    std::mutex mutex;
    std::vector<EngineEvent> events;

    size_t Count(EventKind kind, const std::optional<PeerId>& target = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t count = 0;
        for (auto& event : events) {
            if (event.kind == kind && (!target || event.target == target)) {
                ++count;
            }
        }
        return count;
    }

    std::optional<EngineEvent> Find(EventKind kind, const PeerId& target, const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& event : events) {
            if (event.kind == kind && event.target == target && event.data.value("type", "") == type) {
                return event;
            }
        }
        return std::nullopt;
    }
};

class RtcEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Engine_ = std::make_unique<RtcEngine>("alpha", RtcEngine::Options{});
        Engine_->OnEvent([log = Log_](EngineEvent&& event) {
            std::lock_guard<std::mutex> lock(log->mutex);
            log->events.push_back(std::move(event));
        });
    }

    void Send(CommandKind kind, const PeerId& peer = {}, Payload data = {}) {
        Engine_->Command(EngineCommand{kind, peer, std::move(data)});
    }

    // Commands run in order, so once shutdown is acknowledged every earlier
    // command has been handled.
    void ShutdownAndWait() {
        Send(CommandKind::Shutdown);
        ASSERT_TRUE(WaitFor([this] { return Log_->Count(EventKind::ShutdownComplete) > 0; }));
    }

    std::shared_ptr<EventLog> Log_ = std::make_shared<EventLog>();
    std::unique_ptr<RtcEngine> Engine_;
};

TEST_F(RtcEngineTest, AddPeerReportsReady) {
    Send(CommandKind::AddPeer, "p1");
    Send(CommandKind::AddPeer, "p1");
    Send(CommandKind::AddPeer, "p2");
    ShutdownAndWait();

    EXPECT_EQ(Log_->Count(EventKind::PeerReady, PeerId{"p1"}), 1u);
    EXPECT_EQ(Log_->Count(EventKind::PeerReady, PeerId{"p2"}), 1u);
    EXPECT_EQ(Log_->Count(EventKind::Crashed), 0u);
}

TEST_F(RtcEngineTest, CommandsAfterShutdownAreRejected) {
    Send(CommandKind::AddPeer, "p1");
    ShutdownAndWait();

    EXPECT_EQ(Log_->Count(EventKind::ShutdownComplete), 1u);
    EXPECT_THROW(Send(CommandKind::AddPeer, "p2"), EngineError);
    EXPECT_THROW(Send(CommandKind::Shutdown), EngineError);
    EXPECT_EQ(Log_->Count(EventKind::PeerReady, PeerId{"p2"}), 0u);
}

TEST_F(RtcEngineTest, MalformedMediaEventsAreIgnored) {
    Send(CommandKind::AddPeer, "p1");
    Send(CommandKind::MediaEvent, "ghost", {{"type", "offer"}, {"sdp", "v=0\r\n"}});
    Send(CommandKind::MediaEvent, "p1", {{"sdp", "v=0\r\n"}});
    Send(CommandKind::MediaEvent, "p1", {{"type", 7}});
    Send(CommandKind::MediaEvent, "p1", {{"type", "offer"}});
    Send(CommandKind::MediaEvent, "p1", {{"type", "candidate"}});
    Send(CommandKind::MediaEvent, "p1", {{"type", "renegotiate"}});
    Send(CommandKind::RemovePeer, "ghost");
    ShutdownAndWait();

    EXPECT_EQ(Log_->Count(EventKind::MediaEvent), 0u);
    EXPECT_EQ(Log_->Count(EventKind::PeerFailed), 0u);
    EXPECT_EQ(Log_->Count(EventKind::Crashed), 0u);
}

TEST_F(RtcEngineTest, OfferIsAnsweredForThatPeer) {
    Send(CommandKind::AddPeer, "p1");
    Send(CommandKind::AddPeer, "p2");

    std::promise<std::string> offer;
    auto offerReady = offer.get_future();
    auto client = std::make_shared<rtc::PeerConnection>(rtc::Configuration{});
    client->onLocalDescription([&offer, sent = false](rtc::Description desc) mutable {
        if (!sent && desc.type() == rtc::Description::Type::Offer) {
            sent = true;
            offer.set_value(std::string(desc));
        }
    });
    auto channel = client->createDataChannel("signal");
    ASSERT_EQ(offerReady.wait_for(5s), std::future_status::ready);

    Send(CommandKind::MediaEvent, "p1", {{"type", "offer"}, {"sdp", offerReady.get()}});

    std::optional<EngineEvent> answer;
    ASSERT_TRUE(WaitFor([&] {
        answer = Log_->Find(EventKind::MediaEvent, "p1", "answer");
        return answer.has_value();
    }, 5s));
    EXPECT_FALSE(answer->data["sdp"].get<std::string>().empty());
    EXPECT_FALSE(Log_->Find(EventKind::MediaEvent, "p2", "answer").has_value());

    client->setRemoteDescription(rtc::Description(answer->data["sdp"].get<std::string>(), "answer"));

    ShutdownAndWait();
    EXPECT_EQ(Log_->Count(EventKind::Crashed), 0u);
    client->close();
}

TEST_F(RtcEngineTest, RemovedPeerNoLongerTakesMediaEvents) {
    Send(CommandKind::AddPeer, "p1");
    Send(CommandKind::RemovePeer, "p1");
    Send(CommandKind::MediaEvent, "p1", {{"type", "offer"}, {"sdp", "v=0\r\n"}});

    // A removed id can be added again.
    Send(CommandKind::AddPeer, "p1");
    ShutdownAndWait();

    EXPECT_EQ(Log_->Count(EventKind::PeerReady, PeerId{"p1"}), 2u);
    EXPECT_EQ(Log_->Count(EventKind::MediaEvent), 0u);
}

TEST(RtcEngineLifetimeTest, DestroyWithoutShutdown) {
    auto log = std::make_shared<EventLog>();
    {
        RtcEngine engine("alpha", RtcEngine::Options{});
        engine.OnEvent([log](EngineEvent&& event) {
            std::lock_guard<std::mutex> lock(log->mutex);
            log->events.push_back(std::move(event));
        });
        engine.Command(EngineCommand{CommandKind::AddPeer, "p1", {}});
        ASSERT_TRUE(WaitFor([&] { return log->Count(EventKind::PeerReady) > 0; }));
    }

    // Teardown is silent; it never reports a shutdown or a crash.
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(log->Count(EventKind::ShutdownComplete), 0u);
    EXPECT_EQ(log->Count(EventKind::Crashed), 0u);
}

TEST(RtcEngineFactoryTest, MakesIndependentEngines) {
    auto factory = RtcEngine::Factory(RtcEngine::Options{});
    auto first = factory("alpha");
    auto second = factory("beta");
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    first->Command(EngineCommand{CommandKind::Shutdown, {}, {}});
    EXPECT_THROW(first->Command(EngineCommand{CommandKind::AddPeer, "p1", {}}), EngineError);
    EXPECT_NO_THROW(second->Command(EngineCommand{CommandKind::AddPeer, "p1", {}}));
}

} // namespace
} // namespace huddle
