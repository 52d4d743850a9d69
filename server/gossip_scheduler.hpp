#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <thread>

#include "gossip_strategy.hpp"

namespace chatlog {

struct SchedulerOptions {
    std::chrono::milliseconds interval{1000};
    // Each wait lasts interval plus a uniform draw from [0, jitter], so
    // nodes drift apart instead of gossiping in lockstep.
    std::chrono::milliseconds jitter{500};
};

// GossipScheduler drives GossipStrategy::run_round from one background
// thread. It does nothing until start() and is stopped and joined by
// stop() or the destructor.
class GossipScheduler {
public:
    GossipScheduler(GossipStrategy& strategy, SchedulerOptions options);
    ~GossipScheduler();

    GossipScheduler(const GossipScheduler&) = delete;
    GossipScheduler& operator=(const GossipScheduler&) = delete;

    void start();
    void stop();

    bool running() const;
    uint64_t rounds_completed() const { return rounds_.load(); }

private:
    void loop();
    std::chrono::milliseconds next_delay();

    GossipStrategy& strategy_;
    SchedulerOptions options_;
    std::mt19937 rng_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread worker_;
    std::atomic<uint64_t> rounds_{0};
};

}  // namespace chatlog
