#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

#include "cluster_view.hpp"
#include "message_store.hpp"
#include "transport.hpp"
#include "write_strategy.hpp"

namespace chatlog {

struct GossipOptions {
    // Peers contacted per round; 0 means every peer.
    std::size_t fanout = 0;
};

// Counters for one anti-entropy round.
struct RoundStats {
    std::size_t peers_contacted = 0;
    std::size_t failures = 0;
    std::size_t merged = 0;  // messages pulled from peers and newly stored
    std::size_t pushed = 0;  // messages sent to peers that lacked them
};

// GossipStrategy accepts writes locally without any coordination and
// spreads them with periodic push-pull exchanges. Merging goes through
// MessageStore::append, so it is idempotent and order independent.
class GossipStrategy final : public WriteStrategy {
public:
    GossipStrategy(const ClusterView& cluster, MessageStore& store,
                   std::shared_ptr<Transport> transport, PeerLiveness& liveness,
                   GossipOptions options = {});

    WriteResult write(const Message& message) override;

    // run_round syncs with the selected peers concurrently. A failure with
    // one peer is logged and counted; the next round retries it.
    RoundStats run_round();

    std::vector<NodeInfo> select_peers();

private:
    struct PeerOutcome {
        bool failed = false;
        std::size_t merged = 0;
        std::size_t pushed = 0;
    };

    PeerOutcome sync_with_peer(const NodeInfo& peer);

    const ClusterView& cluster_;
    MessageStore& store_;
    std::shared_ptr<Transport> transport_;
    PeerLiveness& liveness_;
    GossipOptions options_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

}  // namespace chatlog
