#include "services.hpp"

#include <spdlog/spdlog.h>

#include "outcome_trailer.hpp"
#include "wire.hpp"

using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;

namespace chatlog {

// PostMessage answers COMMITTED or ACCEPTED depending on the mode; a quorum
// failure is UNAVAILABLE so clients can tell it apart from bad input.
Status ChatServiceImpl::PostMessage(ServerContext* ctx, const chatrpc::PostMessageRequest* req,
                                    chatrpc::PostMessageReply* reply) {
    WriteResult r = coordinator_->submit(req->text(), req->user());
    ctx->AddTrailingMetadata(kWriteOutcomeTrailer, to_string(r.outcome));
    switch (r.outcome) {
        case WriteOutcome::Invalid:
            return Status(StatusCode::INVALID_ARGUMENT, r.detail);
        case WriteOutcome::QuorumNotReached:
            return Status(StatusCode::UNAVAILABLE, "write quorum failed: " + r.detail);
        case WriteOutcome::Committed:
            reply->set_status(chatrpc::COMMITTED);
            break;
        case WriteOutcome::Accepted:
            reply->set_status(chatrpc::ACCEPTED);
            break;
    }
    reply->set_mode(to_string(coordinator_->mode()));
    reply->set_replicas(static_cast<int32_t>(r.acks));
    to_wire(r.message, reply->mutable_message());
    return Status::OK;
}

Status ChatServiceImpl::ListMessages(ServerContext*, const chatrpc::ListMessagesRequest*,
                                     chatrpc::ListMessagesReply* reply) {
    auto messages = coordinator_->list();
    reply->set_node_id(coordinator_->node_id());
    for (const auto& m : messages) {
        to_wire(m, reply->add_messages());
    }
    reply->set_count(static_cast<int32_t>(messages.size()));
    reply->set_local_only(true);
    return Status::OK;
}

Status ChatServiceImpl::Health(ServerContext*, const chatrpc::HealthRequest*,
                               chatrpc::HealthReply* reply) {
    const ClusterView& cluster = coordinator_->cluster();
    reply->set_status("up");
    reply->set_node_id(coordinator_->node_id());
    reply->set_mode(to_string(coordinator_->mode()));
    reply->set_cluster_size(static_cast<int32_t>(cluster.size()));
    reply->set_quorum_size(static_cast<int32_t>(cluster.quorum_size()));
    reply->set_message_count(static_cast<int32_t>(coordinator_->store().size()));
    for (const auto& peer : cluster.peers()) {
        PeerLiveness::Entry e = coordinator_->liveness().get(peer.id);
        chatrpc::PeerHealth* p = reply->add_peers();
        p->set_node_id(peer.id);
        p->set_address(peer.address);
        p->set_reachable(e.reachable);
        p->set_last_status(e.last_status);
    }
    return Status::OK;
}

Status ReplicaServiceImpl::Replicate(ServerContext*, const chatrpc::ReplicateRequest* req,
                                     chatrpc::ReplicateReply* reply) {
    if (!req->has_message()) {
        return Status(StatusCode::INVALID_ARGUMENT, "replicate request without message");
    }
    bool duplicate = false;
    bool ack = coordinator_->accept_replica(from_wire(req->message()), &duplicate);
    reply->set_ack(ack);
    reply->set_duplicate(duplicate);
    return Status::OK;
}

Status ReplicaServiceImpl::Exchange(ServerContext*, const chatrpc::ExchangeRequest* req,
                                    chatrpc::ExchangeReply* reply) {
    ExchangeResult ex = coordinator_->serve_exchange(from_wire(req->digest()));
    to_wire(ex.remote_digest, reply->mutable_digest());
    for (const auto& m : ex.missing) {
        to_wire(m, reply->add_missing());
    }
    spdlog::debug("exchange from {}: sending {} messages", req->from_node(), ex.missing.size());
    return Status::OK;
}

Status ReplicaServiceImpl::Push(ServerContext*, const chatrpc::PushRequest* req,
                                chatrpc::PushReply* reply) {
    std::size_t merged = coordinator_->accept_push(from_wire_list(req->messages()));
    if (merged > 0) {
        spdlog::info("Gossip merged {} messages pushed by {}", merged, req->from_node());
    }
    reply->set_merged(static_cast<int32_t>(merged));
    return Status::OK;
}

}  // namespace chatlog
