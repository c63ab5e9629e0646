#include "relay/pipeline_registry.h"

#include "fake_peer_connection.h"

#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace relay;
using namespace relay_test;
using MediaRelay::ErrorCode;
using Network::MediaKind;

namespace {

constexpr uint32_t kVideoSsrc = 1111;

}  // namespace

class PipelineRegistryTest : public ::testing::Test {
   protected:
    void SetUp() override {
        config.keyframeIntervalMs = 60000;
        config.statIntervalMs = 20;
        registry = std::make_unique<PipelineRegistry>(config);
    }

    void TearDown() override {
        registry.reset();
    }

    std::shared_ptr<ConnectionTransport> makeTransport(const std::string& id, TransportRole role) {
        auto peer = std::make_shared<FakePeer>();
        peers.push_back(peer);
        return std::make_shared<ConnectionTransport>(
            id, role, std::make_unique<FakePeerConnection>(peer), config, registry->resolver());
    }

    std::shared_ptr<ConnectionTransport> makeSubscriber(const std::string& id,
                                                        const std::string& sessionId) {
        auto transport = makeTransport(id, TransportRole::Subscriber);
        Network::SessionDescription answer;
        EXPECT_EQ(transport->answerSubscribe({"offer", "v=0"}, {{kVideoSsrc, 96}}, sessionId,
                                             answer),
                  ErrorCode::OK);
        return transport;
    }

    RelayConfig config;
    std::unique_ptr<PipelineRegistry> registry;
    std::vector<std::shared_ptr<FakePeer>> peers;
};

// ============================================================
// Lookup and creation
// ============================================================

TEST_F(PipelineRegistryTest, GetOrCreateReturnsSameInstance) {
    auto first = registry->getOrCreate("s1");
    auto second = registry->getOrCreate("s1");
    EXPECT_EQ(first, second);
    EXPECT_EQ(registry->find("s1"), first);
    EXPECT_EQ(registry->find("missing"), nullptr);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(PipelineRegistryTest, ConcurrentGetOrCreateYieldsOnePipeline) {
    constexpr int kThreads = 16;
    std::vector<std::shared_ptr<ForwardingPipeline>> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() { results[i] = registry->getOrCreate("shared"); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<ForwardingPipeline*> distinct;
    for (const auto& pipeline : results) {
        distinct.insert(pipeline.get());
    }
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(PipelineRegistryTest, ConcurrentJoinsShareOnePipeline) {
    constexpr int kSubscribers = 8;
    std::vector<std::shared_ptr<ConnectionTransport>> publishers;
    for (const char* id : {"pub-a", "pub-b"}) {
        auto publisher = makeTransport(id, TransportRole::Publisher);
        Network::SessionDescription answer;
        ASSERT_EQ(publisher->answerPublish({"offer", "v=0"}, {{"video", true}}, nullptr, answer),
                  ErrorCode::OK);
        publishers.push_back(publisher);
    }
    std::vector<std::shared_ptr<ConnectionTransport>> subscribers;
    for (int i = 0; i < kSubscribers; ++i) {
        subscribers.push_back(makeSubscriber("sub-" + std::to_string(i), "x"));
    }

    std::vector<ErrorCode> publishResults(publishers.size());
    std::vector<ErrorCode> subscribeResults(subscribers.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < publishers.size(); ++i) {
        threads.emplace_back(
            [&, i]() { publishResults[i] = registry->bindPublisher("x", publishers[i]); });
    }
    for (size_t i = 0; i < subscribers.size(); ++i) {
        threads.emplace_back(
            [&, i]() { subscribeResults[i] = registry->addSubscriber("x", subscribers[i]); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (ErrorCode rc : subscribeResults) {
        EXPECT_EQ(rc, ErrorCode::OK);
    }
    int bound = 0;
    for (ErrorCode rc : publishResults) {
        if (rc == ErrorCode::OK) {
            ++bound;
        } else {
            EXPECT_EQ(rc, ErrorCode::PIPELINE_PUBLISHER_EXISTS);
        }
    }
    EXPECT_EQ(bound, 1);

    EXPECT_EQ(registry->size(), 1u);
    auto pipeline = registry->find("x");
    ASSERT_NE(pipeline, nullptr);
    ASSERT_NE(pipeline->publisher(), nullptr);
    const std::string winner = pipeline->publisher()->id();
    EXPECT_TRUE(winner == "pub-a" || winner == "pub-b");
    EXPECT_EQ(pipeline->subscriberCount(), static_cast<size_t>(kSubscribers));
}

TEST_F(PipelineRegistryTest, ResolverFindsLivePipelines) {
    auto resolve = registry->resolver();
    EXPECT_EQ(resolve("s1"), nullptr);
    auto pipeline = registry->getOrCreate("s1");
    EXPECT_EQ(resolve("s1"), pipeline);
}

// ============================================================
// Membership and teardown
// ============================================================

TEST_F(PipelineRegistryTest, LastSubscriberLeavingRemovesPipeline) {
    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("a", "s1")), ErrorCode::OK);
    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("b", "s1")), ErrorCode::OK);
    auto original = registry->find("s1");
    ASSERT_NE(original, nullptr);

    ASSERT_EQ(registry->removeSubscriber("s1", "a"), ErrorCode::OK);
    EXPECT_EQ(registry->find("s1"), original);

    ASSERT_EQ(registry->removeSubscriber("s1", "b"), ErrorCode::OK);
    EXPECT_EQ(registry->find("s1"), nullptr);
    EXPECT_TRUE(original->isClosed());
    EXPECT_TRUE(peers[0]->closed());
    EXPECT_TRUE(peers[1]->closed());

    // A later reference creates a fresh pipeline
    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("c", "s1")), ErrorCode::OK);
    auto fresh = registry->find("s1");
    ASSERT_NE(fresh, nullptr);
    EXPECT_NE(fresh, original);
    EXPECT_FALSE(fresh->isClosed());
}

TEST_F(PipelineRegistryTest, RemoveUnknownMembers) {
    EXPECT_EQ(registry->removeSubscriber("nope", "a"), ErrorCode::PIPELINE_NOT_FOUND);
    EXPECT_EQ(registry->removePublisher("nope"), ErrorCode::PIPELINE_NOT_FOUND);

    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("a", "s1")), ErrorCode::OK);
    EXPECT_EQ(registry->removeSubscriber("s1", "zzz"), ErrorCode::PIPELINE_SUBSCRIBER_NOT_FOUND);
    EXPECT_EQ(registry->removePublisher("s1"), ErrorCode::PIPELINE_NO_PUBLISHER);
    EXPECT_NE(registry->find("s1"), nullptr);
}

TEST_F(PipelineRegistryTest, PublisherLeavingKeepsSubscribedPipeline) {
    auto publisher = makeTransport("pub", TransportRole::Publisher);
    Network::SessionDescription answer;
    ASSERT_EQ(publisher->answerPublish({"offer", "v=0"}, {{"video", true}}, nullptr, answer),
              ErrorCode::OK);
    ASSERT_EQ(registry->bindPublisher("s1", publisher), ErrorCode::OK);
    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("a", "s1")), ErrorCode::OK);

    ASSERT_EQ(registry->removePublisher("s1"), ErrorCode::OK);
    EXPECT_TRUE(publisher->isClosed());
    auto pipeline = registry->find("s1");
    ASSERT_NE(pipeline, nullptr);
    EXPECT_EQ(pipeline->publisher(), nullptr);
    EXPECT_EQ(pipeline->subscriberCount(), 1u);

    ASSERT_EQ(registry->removeSubscriber("s1", "a"), ErrorCode::OK);
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(PipelineRegistryTest, FailedBindLeavesNoEmptyPipeline) {
    EXPECT_EQ(registry->bindPublisher("s1", nullptr), ErrorCode::VALIDATION_INVALID_PARAMS);
    EXPECT_EQ(registry->find("s1"), nullptr);
}

TEST_F(PipelineRegistryTest, SubscriberFeedbackReachesPipelineThroughResolver) {
    auto publisher = makeTransport("pub", TransportRole::Publisher);
    Network::SessionDescription answer;
    ASSERT_EQ(publisher->answerPublish({"offer", "v=0"}, {{"video", true}}, nullptr, answer),
              ErrorCode::OK);
    auto publisherPeer = peers.back();
    publisherPeer->announceTrack(kVideoSsrc, 96, MediaKind::Video);
    ASSERT_EQ(registry->bindPublisher("s1", publisher), ErrorCode::OK);

    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("a", "s1")), ErrorCode::OK);
    auto subscriberPeer = peers.back();

    // A missed sequence goes back to the publisher as a retransmission request
    subscriberPeer->sender(kVideoSsrc)->deliver(
        {Network::makeSingleRetransmission(1, kVideoSsrc, 900)});
    ASSERT_TRUE(waitUntil([&]() {
        return !publisherPeer->writtenFeedbackOf<Network::RetransmissionRequest>().empty();
    }));
    auto requests = publisherPeer->writtenFeedbackOf<Network::RetransmissionRequest>();
    EXPECT_EQ(requests[0].sequences(), (std::vector<uint16_t>{900}));
}

TEST_F(PipelineRegistryTest, CloseAllClosesEverything) {
    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("a", "s1")), ErrorCode::OK);
    ASSERT_EQ(registry->addSubscriber("s2", makeSubscriber("b", "s2")), ErrorCode::OK);
    EXPECT_EQ(registry->size(), 2u);

    registry->closeAll();
    EXPECT_EQ(registry->size(), 0u);
    for (const auto& peer : peers) {
        EXPECT_TRUE(peer->closed());
    }
}

// ============================================================
// Statistics sweep
// ============================================================

TEST_F(PipelineRegistryTest, SweepStatsReportsEveryPipeline) {
    ASSERT_EQ(registry->addSubscriber("s1", makeSubscriber("a", "s1")), ErrorCode::OK);
    registry->getOrCreate("s2");

    auto stats = registry->sweepStats();
    EXPECT_EQ(stats["count"], 2);
    ASSERT_EQ(stats["pipelines"].size(), 2u);
    std::set<std::string> sessions;
    for (const auto& entry : stats["pipelines"]) {
        sessions.insert(entry["session_id"].get<std::string>());
    }
    EXPECT_EQ(sessions, (std::set<std::string>{"s1", "s2"}));
}

TEST_F(PipelineRegistryTest, PeriodicSweepStartsAndStops) {
    registry->startStatsSweep();
    registry->startStatsSweep();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    registry->stopStatsSweep();
    registry->stopStatsSweep();
    SUCCEED();
}
