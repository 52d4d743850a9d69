#include "gossip_strategy.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace chatlog {

GossipStrategy::GossipStrategy(const ClusterView& cluster, MessageStore& store,
                               std::shared_ptr<Transport> transport, PeerLiveness& liveness,
                               GossipOptions options)
    : cluster_(cluster),
      store_(store),
      transport_(std::move(transport)),
      liveness_(liveness),
      options_(options),
      rng_(std::random_device{}()) {}

WriteResult GossipStrategy::write(const Message& message) {
    WriteResult result;
    result.message = message;
    result.required = 1;
    result.cluster_size = cluster_.size();

    if (!store_.append(message)) {
        spdlog::error("Gossip write refused: id {} is already in use", message.id);
        result.outcome = WriteOutcome::Invalid;
        result.detail = "message id " + message.id + " is already in use";
        return result;
    }
    result.outcome = WriteOutcome::Accepted;
    result.acks = 1;
    result.detail = "Propagation in progress";
    return result;
}

std::vector<NodeInfo> GossipStrategy::select_peers() {
    auto peers = cluster_.peers();
    if (options_.fanout == 0 || options_.fanout >= peers.size()) {
        return peers;
    }
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::shuffle(peers.begin(), peers.end(), rng_);
    peers.resize(options_.fanout);
    return peers;
}

RoundStats GossipStrategy::run_round() {
    const auto peers = select_peers();
    std::vector<PeerOutcome> outcomes(peers.size());

    std::vector<std::thread> ths;
    ths.reserve(peers.size());
    for (std::size_t i = 0; i < peers.size(); ++i) {
        try {
            ths.emplace_back([&, i] { outcomes[i] = sync_with_peer(peers[i]); });
        } catch (const std::system_error& e) {
            spdlog::warn("Gossip falling back to inline sync with {}: {}", peers[i].id, e.what());
            outcomes[i] = sync_with_peer(peers[i]);
        }
    }
    for (auto& t : ths) t.join();

    RoundStats stats;
    stats.peers_contacted = peers.size();
    for (const auto& o : outcomes) {
        if (o.failed) ++stats.failures;
        stats.merged += o.merged;
        stats.pushed += o.pushed;
    }
    if (stats.merged > 0 || stats.pushed > 0) {
        spdlog::info("Gossip round: merged {} pushed {} across {} peers ({} failed)",
                     stats.merged, stats.pushed, stats.peers_contacted, stats.failures);
    }
    return stats;
}

GossipStrategy::PeerOutcome GossipStrategy::sync_with_peer(const NodeInfo& peer) {
    PeerOutcome out;

    // Pull: hand over our digest, receive everything the peer has beyond it.
    ExchangeResult ex = transport_->exchange(peer, store_.digest());
    liveness_.record(peer.id, ex.status == CallStatus::Ok, to_string(ex.status));
    if (ex.status != CallStatus::Ok) {
        spdlog::warn("Gossip sync failed with {}: {}", peer.id, to_string(ex.status));
        out.failed = true;
        return out;
    }
    for (const auto& m : ex.missing) {
        if (store_.append(m)) ++out.merged;
    }
    if (out.merged > 0) {
        spdlog::debug("Gossip merged {} messages from {}", out.merged, peer.id);
    }

    // Push: send what the peer's digest shows it lacks.
    auto lacking = store_.messages_since(ex.remote_digest);
    if (lacking.empty()) {
        return out;
    }
    CallStatus status = transport_->push(peer, lacking);
    if (status != CallStatus::Ok) {
        liveness_.record(peer.id, false, to_string(status));
        spdlog::warn("Gossip push of {} messages to {} failed: {}", lacking.size(), peer.id,
                     to_string(status));
        out.failed = true;
        return out;
    }
    out.pushed = lacking.size();
    return out;
}

}  // namespace chatlog
