#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "gossip_scheduler.hpp"
#include "in_memory_network.hpp"
#include "mock_transport.hpp"

using namespace chatlog;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Test;
using std::chrono::milliseconds;

namespace {

std::set<std::string> ids_on(const ReplicationCoordinator& node) {
    std::set<std::string> out;
    for (const auto& m : node.list()) out.insert(m.id);
    return out;
}

CoordinatorOptions gossip_options(std::size_t fanout = 0) {
    CoordinatorOptions options;
    options.mode = Mode::Gossip;
    options.incarnation = 1;
    options.gossip.fanout = fanout;
    return options;
}

// One gossip round for the whole cluster: every node runs run_round once,
// in the order given.
void run_cluster_round(const std::vector<std::shared_ptr<ReplicationCoordinator>>& nodes) {
    for (const auto& n : nodes) n->gossip()->run_round();
}

class GossipClusterTest : public Test {
protected:
    void SetUp() override {
        nodes_ = net_.make_cluster({"a", "b", "c"}, gossip_options());
        a_ = nodes_[0];
        b_ = nodes_[1];
        c_ = nodes_[2];
    }

    InMemoryNetwork net_{milliseconds(500)};
    std::vector<std::shared_ptr<ReplicationCoordinator>> nodes_;
    std::shared_ptr<ReplicationCoordinator> a_, b_, c_;
};

}  // namespace

TEST_F(GossipClusterTest, WriteIsAcceptedLocallyEvenWhenIsolated) {
    net_.isolate("a");

    WriteResult r = a_->submit("hello", "alice");

    EXPECT_EQ(r.outcome, WriteOutcome::Accepted);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(ids_on(*a_), std::set<std::string>{r.message.id});
    EXPECT_TRUE(ids_on(*b_).empty());
    EXPECT_TRUE(ids_on(*c_).empty());
}

TEST_F(GossipClusterTest, ConvergesWithinTwoRoundsOnFullMesh) {
    a_->submit("one", "alice");
    a_->submit("two", "alice");
    a_->submit("three", "alice");

    // Worst-case order: the receivers gossip before the origin does.
    std::vector<std::shared_ptr<ReplicationCoordinator>> order{c_, b_, a_};
    for (int round = 0; round < 2; ++round) run_cluster_round(order);

    auto expected = ids_on(*a_);
    ASSERT_EQ(expected.size(), 3u);
    EXPECT_EQ(ids_on(*b_), expected);
    EXPECT_EQ(ids_on(*c_), expected);
}

TEST_F(GossipClusterTest, ConvergesAcrossLineTopologyWithinDiameterRounds) {
    // a - b - c: a and c only hear of each other through b.
    net_.cut("a", "c");
    a_->submit("from a", "alice");
    c_->submit("from c", "carol");

    std::vector<std::shared_ptr<ReplicationCoordinator>> order{c_, b_, a_};
    for (int round = 0; round < 2; ++round) run_cluster_round(order);

    std::set<std::string> expected{"a:1:1", "c:1:1"};
    EXPECT_EQ(ids_on(*a_), expected);
    EXPECT_EQ(ids_on(*b_), expected);
    EXPECT_EQ(ids_on(*c_), expected);
}

TEST_F(GossipClusterTest, ConcurrentWritesAtDifferentOriginsConverge) {
    std::vector<std::thread> writers;
    for (const auto& node : nodes_) {
        writers.emplace_back([node] {
            for (int i = 0; i < 20; ++i) node->submit("msg " + std::to_string(i), "bob");
        });
    }
    for (auto& t : writers) t.join();

    for (int round = 0; round < 2; ++round) run_cluster_round(nodes_);

    auto expected = ids_on(*a_);
    EXPECT_EQ(expected.size(), 60u);
    EXPECT_EQ(ids_on(*b_), expected);
    EXPECT_EQ(ids_on(*c_), expected);
}

TEST_F(GossipClusterTest, RepeatedRoundWithoutNewDataChangesNothing) {
    a_->submit("one", "alice");
    b_->submit("two", "bob");
    for (int round = 0; round < 2; ++round) run_cluster_round(nodes_);

    auto before_a = a_->list();
    for (const auto& n : nodes_) {
        RoundStats stats = n->gossip()->run_round();
        EXPECT_EQ(stats.merged, 0u);
        EXPECT_EQ(stats.pushed, 0u);
        EXPECT_EQ(stats.failures, 0u);
        EXPECT_EQ(stats.peers_contacted, 2u);
    }
    auto after_a = a_->list();
    ASSERT_EQ(after_a.size(), before_a.size());
    for (std::size_t i = 0; i < after_a.size(); ++i) {
        EXPECT_EQ(after_a[i].id, before_a[i].id);
    }
}

TEST_F(GossipClusterTest, MergingSameMessagesTwiceNeverDuplicates) {
    a_->submit("one", "alice");
    a_->submit("two", "alice");
    auto messages = a_->list();

    EXPECT_EQ(b_->accept_push(messages), 2u);
    EXPECT_EQ(b_->accept_push(messages), 0u);
    EXPECT_EQ(b_->list().size(), 2u);
}

TEST_F(GossipClusterTest, PartitionDefersPropagationUntilHealed) {
    net_.partition({{"a"}, {"b", "c"}});
    a_->submit("lonely", "alice");
    b_->submit("majority", "bob");

    RoundStats stats = a_->gossip()->run_round();
    EXPECT_EQ(stats.failures, 2u);
    run_cluster_round(nodes_);
    EXPECT_EQ(ids_on(*a_), std::set<std::string>{"a:1:1"});
    EXPECT_EQ(ids_on(*c_), std::set<std::string>{"b:1:1"});

    net_.heal();
    for (int round = 0; round < 2; ++round) run_cluster_round(nodes_);

    std::set<std::string> expected{"a:1:1", "b:1:1"};
    EXPECT_EQ(ids_on(*a_), expected);
    EXPECT_EQ(ids_on(*b_), expected);
    EXPECT_EQ(ids_on(*c_), expected);
}

TEST_F(GossipClusterTest, SlowPeerDoesNotFailRoundForOthers) {
    net_.set_delay("b", milliseconds(1000));  // above the 500ms call timeout
    a_->submit("one", "alice");

    RoundStats stats = a_->gossip()->run_round();

    EXPECT_EQ(stats.peers_contacted, 2u);
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_EQ(ids_on(*c_), std::set<std::string>{"a:1:1"});
    EXPECT_FALSE(a_->liveness().get("b").reachable);
    EXPECT_EQ(a_->liveness().get("b").last_status, "timeout");
    EXPECT_TRUE(a_->liveness().get("c").reachable);
}

TEST_F(GossipClusterTest, RestartedOriginKeepsNewWritesApartFromOldOnes) {
    a_->submit("old incarnation", "alice");
    for (int round = 0; round < 2; ++round) run_cluster_round(nodes_);
    ASSERT_EQ(ids_on(*b_), std::set<std::string>{"a:1:1"});

    auto restarted = net_.restart("a", gossip_options());
    std::vector<std::shared_ptr<ReplicationCoordinator>> live{restarted, b_, c_};
    // The fresh process pulls its previous life's messages back first.
    restarted->gossip()->run_round();
    EXPECT_EQ(ids_on(*restarted), std::set<std::string>{"a:1:1"});

    WriteResult r = restarted->submit("new text", "alice");
    ASSERT_EQ(r.outcome, WriteOutcome::Accepted);
    EXPECT_EQ(r.message.id, "a:2:1");
    EXPECT_EQ(restarted->store().find("a:2:1")->text, "new text");

    for (int round = 0; round < 2; ++round) run_cluster_round(live);
    std::set<std::string> expected{"a:1:1", "a:2:1"};
    for (const auto& node : live) {
        EXPECT_EQ(ids_on(*node), expected);
        EXPECT_EQ(node->store().find("a:1:1")->text, "old incarnation");
        EXPECT_EQ(node->store().find("a:2:1")->text, "new text");
    }
}

TEST(GossipStrategyTest, WriteOfHeldIdIsRefused) {
    ClusterView cluster("a", {NodeInfo{"a", "a"}});
    MessageStore store;
    PeerLiveness liveness;
    auto transport = std::make_shared<StrictMock<MockTransport>>();
    GossipStrategy strategy(cluster, store, transport, liveness);

    Message m;
    m.origin_node = "a";
    m.incarnation = 1;
    m.version = 1;
    m.id = make_message_id("a", 1, 1);
    m.text = "first";
    ASSERT_EQ(strategy.write(m).outcome, WriteOutcome::Accepted);

    m.text = "second";
    WriteResult again = strategy.write(m);
    EXPECT_EQ(again.outcome, WriteOutcome::Invalid);
    EXPECT_FALSE(again.ok());
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find(m.id)->text, "first");
}

TEST(GossipStrategyTest, FanoutLimitsPeersPerRound) {
    std::vector<NodeInfo> members;
    for (const char* id : {"a", "b", "c", "d", "e"}) members.push_back(NodeInfo{id, id});
    ClusterView cluster("a", members);
    MessageStore store;
    PeerLiveness liveness;
    auto transport = std::make_shared<NiceMock<MockTransport>>();

    GossipOptions options;
    options.fanout = 2;
    GossipStrategy strategy(cluster, store, transport, liveness, options);

    for (int i = 0; i < 20; ++i) {
        auto peers = strategy.select_peers();
        ASSERT_EQ(peers.size(), 2u);
        EXPECT_NE(peers[0].id, peers[1].id);
        for (const auto& p : peers) EXPECT_NE(p.id, "a");
    }
}

TEST(GossipStrategyTest, PushesOnlyWhatPeerLacks) {
    ClusterView cluster("a", {NodeInfo{"a", "a"}, NodeInfo{"b", "b"}});
    MessageStore store;
    PeerLiveness liveness;
    auto transport = std::make_shared<StrictMock<MockTransport>>();
    GossipStrategy strategy(cluster, store, transport, liveness);

    for (uint64_t v = 1; v <= 3; ++v) {
        Message m;
        m.origin_node = "a";
        m.incarnation = 1;
        m.version = v;
        m.id = make_message_id("a", 1, v);
        m.text = "t";
        strategy.write(m);
    }

    ExchangeResult reply;
    reply.status = CallStatus::Ok;
    reply.remote_digest = {{"a:1", 2}};
    EXPECT_CALL(*transport, exchange(_, _)).WillOnce(Return(reply));
    EXPECT_CALL(*transport, push(_, ElementsAre(Field(&Message::id, "a:1:3"))))
        .WillOnce(Return(CallStatus::Ok));

    RoundStats stats = strategy.run_round();
    EXPECT_EQ(stats.pushed, 1u);
    EXPECT_EQ(stats.merged, 0u);
}

TEST(GossipSchedulerTest, RunsRoundsUntilStopped) {
    InMemoryNetwork net;
    auto nodes = net.make_cluster({"a", "b"}, gossip_options());
    SchedulerOptions options;
    options.interval = milliseconds(10);
    options.jitter = milliseconds(0);
    GossipScheduler scheduler(*nodes[0]->gossip(), options);

    EXPECT_FALSE(scheduler.running());
    scheduler.start();
    scheduler.start();  // no second worker
    EXPECT_TRUE(scheduler.running());

    auto deadline = std::chrono::steady_clock::now() + milliseconds(3000);
    while (scheduler.rounds_completed() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    EXPECT_GE(scheduler.rounds_completed(), 3u);

    scheduler.stop();
    EXPECT_FALSE(scheduler.running());
    auto rounds = scheduler.rounds_completed();
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_EQ(scheduler.rounds_completed(), rounds);
    scheduler.stop();  // already stopped
}

TEST(GossipSchedulerTest, StopIsPromptWithLongInterval) {
    InMemoryNetwork net;
    auto nodes = net.make_cluster({"a", "b"}, gossip_options());
    SchedulerOptions options;
    options.interval = milliseconds(60000);
    GossipScheduler scheduler(*nodes[0]->gossip(), options);
    scheduler.start();

    auto start = std::chrono::steady_clock::now();
    scheduler.stop();
    auto took = std::chrono::steady_clock::now() - start;
    EXPECT_LT(std::chrono::duration_cast<milliseconds>(took).count(), 1000);
    EXPECT_EQ(scheduler.rounds_completed(), 0u);
}

TEST(GossipSchedulerTest, BackgroundRoundsConvergeCluster) {
    InMemoryNetwork net;
    auto nodes = net.make_cluster({"a", "b", "c"}, gossip_options());
    SchedulerOptions options;
    options.interval = milliseconds(20);
    options.jitter = milliseconds(10);

    std::vector<std::unique_ptr<GossipScheduler>> schedulers;
    for (const auto& n : nodes) {
        schedulers.push_back(std::make_unique<GossipScheduler>(*n->gossip(), options));
        schedulers.back()->start();
    }

    nodes[0]->submit("hello", "alice");
    nodes[2]->submit("world", "carol");

    std::set<std::string> expected{"a:1:1", "c:1:1"};
    auto deadline = std::chrono::steady_clock::now() + milliseconds(5000);
    bool converged = false;
    while (!converged && std::chrono::steady_clock::now() < deadline) {
        converged = ids_on(*nodes[0]) == expected && ids_on(*nodes[1]) == expected &&
                    ids_on(*nodes[2]) == expected;
        if (!converged) std::this_thread::sleep_for(milliseconds(10));
    }
    EXPECT_TRUE(converged);

    for (auto& s : schedulers) s->stop();
}
