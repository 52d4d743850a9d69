#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cluster_view.hpp"
#include "gossip_strategy.hpp"
#include "message_store.hpp"
#include "quorum_strategy.hpp"
#include "transport.hpp"
#include "write_strategy.hpp"

namespace chatlog {

constexpr std::size_t kMaxTextBytes = 4096;
constexpr std::size_t kMaxUserBytes = 64;
constexpr const char* kDefaultUser = "anonymous";

struct CoordinatorOptions {
    Mode mode = Mode::Quorum;
    // Process lifetime stamped into every local message id. 0 takes the
    // boot time in milliseconds, which grows across restarts.
    uint64_t incarnation = 0;
    QuorumOptions quorum;
    GossipOptions gossip;
};

// ReplicationCoordinator is what the service layer talks to. It owns the
// node's store and liveness table, stamps client messages with their origin
// identity, and routes writes through the strategy of the configured mode.
// It also answers the peer-facing half of the transport.
class ReplicationCoordinator {
public:
    ReplicationCoordinator(ClusterView cluster, std::shared_ptr<Transport> transport,
                           CoordinatorOptions options);

    ReplicationCoordinator(const ReplicationCoordinator&) = delete;
    ReplicationCoordinator& operator=(const ReplicationCoordinator&) = delete;

    // submit validates, stamps, and writes a new message. Malformed input is
    // reported as WriteOutcome::Invalid and never leaves this node.
    WriteResult submit(const std::string& text, const std::string& user);

    // Local, possibly stale, view of the log.
    std::vector<Message> list() const { return store_.list_all(); }

    // Peer-facing handlers. A duplicate replica is still acknowledged, but
    // an id already held with different content is refused.
    bool accept_replica(const Message& message, bool* duplicate = nullptr);
    ExchangeResult serve_exchange(const VersionDigest& remote) const;
    std::size_t accept_push(const std::vector<Message>& messages);

    Mode mode() const { return options_.mode; }
    const std::string& node_id() const { return cluster_.self().id; }
    uint64_t incarnation() const { return incarnation_; }
    const ClusterView& cluster() const { return cluster_; }
    const PeerLiveness& liveness() const { return liveness_; }
    const MessageStore& store() const { return store_; }

    // Non-null only in gossip mode; the scheduler drives its rounds.
    GossipStrategy* gossip() { return gossip_; }

private:
    ClusterView cluster_;
    MessageStore store_;
    PeerLiveness liveness_;
    std::shared_ptr<Transport> transport_;
    CoordinatorOptions options_;
    uint64_t incarnation_;
    std::atomic<uint64_t> last_version_{0};

    std::unique_ptr<WriteStrategy> strategy_;
    GossipStrategy* gossip_ = nullptr;
};

}  // namespace chatlog
