#include "replication_coordinator.hpp"

#include <spdlog/spdlog.h>

namespace chatlog {

ReplicationCoordinator::ReplicationCoordinator(ClusterView cluster,
                                               std::shared_ptr<Transport> transport,
                                               CoordinatorOptions options)
    : cluster_(std::move(cluster)),
      transport_(std::move(transport)),
      options_(options),
      incarnation_(options.incarnation != 0 ? options.incarnation
                                            : static_cast<uint64_t>(now_millis())) {
    spdlog::info("Node {} incarnation {}", cluster_.self().id, incarnation_);
    if (options_.mode == Mode::Gossip) {
        auto gossip = std::make_unique<GossipStrategy>(cluster_, store_, transport_, liveness_,
                                                       options_.gossip);
        gossip_ = gossip.get();
        strategy_ = std::move(gossip);
    } else {
        strategy_ = std::make_unique<QuorumStrategy>(cluster_, store_, transport_, liveness_,
                                                     options_.quorum);
    }
}

WriteResult ReplicationCoordinator::submit(const std::string& text, const std::string& user) {
    WriteResult invalid;
    invalid.outcome = WriteOutcome::Invalid;
    invalid.cluster_size = cluster_.size();
    if (text.empty()) {
        invalid.detail = "text is required";
        return invalid;
    }
    if (text.size() > kMaxTextBytes) {
        invalid.detail = "text exceeds " + std::to_string(kMaxTextBytes) + " bytes";
        return invalid;
    }
    if (user.size() > kMaxUserBytes) {
        invalid.detail = "user exceeds " + std::to_string(kMaxUserBytes) + " bytes";
        return invalid;
    }

    Message message;
    message.origin_node = node_id();
    message.incarnation = incarnation_;
    message.version = last_version_.fetch_add(1) + 1;
    message.id = make_message_id(message.origin_node, message.incarnation, message.version);
    message.text = text;
    message.user = user.empty() ? kDefaultUser : user;
    message.accepted_at_ms = now_millis();

    WriteResult result = strategy_->write(message);
    spdlog::debug("submit {} -> {}", message.id, to_string(result.outcome));
    return result;
}

bool ReplicationCoordinator::accept_replica(const Message& message, bool* duplicate) {
    if (!has_coherent_identity(message)) {
        spdlog::warn("refusing replica with incoherent id '{}' (origin '{}', version {})",
                     message.id, message.origin_node, message.version);
        return false;
    }
    bool inserted = store_.append(message);
    if (!inserted) {
        auto held = store_.find(message.id);
        if (held && !same_message(*held, message)) {
            spdlog::warn("refusing replica {}: id already held with different content",
                         message.id);
            return false;
        }
    }
    if (duplicate) *duplicate = !inserted;
    return true;
}

ExchangeResult ReplicationCoordinator::serve_exchange(const VersionDigest& remote) const {
    ExchangeResult out;
    out.status = CallStatus::Ok;
    out.remote_digest = store_.digest();
    out.missing = store_.messages_since(remote);
    return out;
}

std::size_t ReplicationCoordinator::accept_push(const std::vector<Message>& messages) {
    std::size_t merged = 0;
    for (const auto& m : messages) {
        if (!has_coherent_identity(m)) {
            spdlog::warn("dropping pushed message with incoherent id '{}'", m.id);
            continue;
        }
        if (store_.append(m)) {
            ++merged;
            continue;
        }
        auto held = store_.find(m.id);
        if (held && !same_message(*held, m)) {
            spdlog::warn("pushed message {} conflicts with the held copy, keeping ours", m.id);
        }
    }
    return merged;
}

}  // namespace chatlog
