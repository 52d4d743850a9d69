#include "gossip_scheduler.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace chatlog {

GossipScheduler::GossipScheduler(GossipStrategy& strategy, SchedulerOptions options)
    : strategy_(strategy), options_(options), rng_(std::random_device{}()) {}

GossipScheduler::~GossipScheduler() { stop(); }

void GossipScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) return;
    stopping_ = false;
    worker_ = std::thread([this] { loop(); });
    spdlog::info("Gossip protocol started (interval={}ms, jitter={}ms)",
                 options_.interval.count(), options_.jitter.count());
}

void GossipScheduler::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) return;
        stopping_ = true;
        worker = std::move(worker_);
    }
    wake_.notify_all();
    worker.join();
    spdlog::info("Gossip protocol stopped after {} rounds", rounds_.load());
}

bool GossipScheduler::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable();
}

std::chrono::milliseconds GossipScheduler::next_delay() {
    if (options_.jitter.count() <= 0) return options_.interval;
    std::uniform_int_distribution<long long> dist(0, options_.jitter.count());
    return options_.interval + std::chrono::milliseconds(dist(rng_));
}

void GossipScheduler::loop() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (wake_.wait_for(lock, next_delay(), [this] { return stopping_; })) {
                return;
            }
        }
        try {
            strategy_.run_round();
        } catch (const std::exception& e) {
            spdlog::error("Gossip round aborted: {}", e.what());
        }
        rounds_.fetch_add(1);
    }
}

}  // namespace chatlog
