#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "cluster_view.hpp"
#include "message_store.hpp"
#include "transport.hpp"
#include "write_strategy.hpp"

namespace chatlog {

struct QuorumOptions {
    // Per-call bound the transport enforces; used here only to cap the wait.
    std::chrono::milliseconds call_timeout{2000};
    // Extra slack on top of call_timeout before outstanding peers are
    // counted as non-acks.
    std::chrono::milliseconds decision_grace{250};
};

// QuorumStrategy replicates every write to all peers concurrently and
// commits once floor(N/2)+1 nodes (self included) acknowledged it. It
// rejects as soon as the outstanding peers can no longer make up a
// majority, so latency follows the slowest necessary responder.
//
// The local store only receives the message on commit, so a rejected write
// leaves no trace on this node. Calls still in flight when a write is
// decided are not cancelled; their threads are joined on a later write or
// at destruction.
class QuorumStrategy final : public WriteStrategy {
public:
    QuorumStrategy(const ClusterView& cluster, MessageStore& store,
                   std::shared_ptr<Transport> transport, PeerLiveness& liveness,
                   QuorumOptions options = {});
    ~QuorumStrategy() override;

    QuorumStrategy(const QuorumStrategy&) = delete;
    QuorumStrategy& operator=(const QuorumStrategy&) = delete;

    WriteResult write(const Message& message) override;

    // Number of replicate calls issued by earlier writes that have not
    // returned yet.
    std::size_t calls_in_flight() const;

private:
    // Shared between the writer and the per-peer threads of one write.
    struct Ballot {
        std::mutex mutex;
        std::condition_variable changed;
        std::size_t acks = 1;  // self
        std::size_t outstanding = 0;
    };

    struct InFlight {
        std::shared_ptr<Ballot> ballot;
        std::vector<std::thread> threads;
    };

    void reap_finished();

    const ClusterView& cluster_;
    MessageStore& store_;
    std::shared_ptr<Transport> transport_;
    PeerLiveness& liveness_;
    QuorumOptions options_;

    mutable std::mutex inflight_mutex_;
    std::list<InFlight> inflight_;
};

}  // namespace chatlog
