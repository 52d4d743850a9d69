#include "grpc_transport.hpp"

#include <spdlog/spdlog.h>

#include "wire.hpp"

namespace chatlog {

GrpcTransport::GrpcTransport(std::string self_id, std::chrono::milliseconds call_timeout)
    : self_id_(std::move(self_id)), call_timeout_(call_timeout) {}

chatrpc::ReplicaService::Stub* GrpcTransport::stub_for(const NodeInfo& peer) {
    std::lock_guard<std::mutex> lock(stubs_mutex_);
    auto& stub = stubs_[peer.address];
    if (!stub) {
        auto ch = grpc::CreateChannel(peer.address, grpc::InsecureChannelCredentials());
        stub = chatrpc::ReplicaService::NewStub(ch);
    }
    return stub.get();
}

void GrpcTransport::set_deadline(grpc::ClientContext* ctx) const {
    ctx->set_deadline(std::chrono::system_clock::now() + call_timeout_);
}

CallStatus GrpcTransport::classify(const grpc::Status& status) {
    if (status.ok()) return CallStatus::Ok;
    switch (status.error_code()) {
        case grpc::StatusCode::DEADLINE_EXCEEDED: return CallStatus::Timeout;
        case grpc::StatusCode::UNAVAILABLE: return CallStatus::Unreachable;
        default: return CallStatus::Failed;
    }
}

CallStatus GrpcTransport::replicate(const NodeInfo& peer, const Message& message) {
    grpc::ClientContext ctx;
    set_deadline(&ctx);
    chatrpc::ReplicateRequest req;
    to_wire(message, req.mutable_message());
    chatrpc::ReplicateReply rep;
    auto s = stub_for(peer)->Replicate(&ctx, req, &rep);
    if (!s.ok()) {
        spdlog::debug("replicate {} -> {} failed: {}", message.id, peer.id, s.error_message());
        return classify(s);
    }
    return rep.ack() ? CallStatus::Ok : CallStatus::Failed;
}

ExchangeResult GrpcTransport::exchange(const NodeInfo& peer, const VersionDigest& local) {
    grpc::ClientContext ctx;
    set_deadline(&ctx);
    chatrpc::ExchangeRequest req;
    req.set_from_node(self_id_);
    to_wire(local, req.mutable_digest());
    chatrpc::ExchangeReply rep;
    auto s = stub_for(peer)->Exchange(&ctx, req, &rep);

    ExchangeResult out;
    out.status = classify(s);
    if (out.status != CallStatus::Ok) {
        spdlog::debug("exchange with {} failed: {}", peer.id, s.error_message());
        return out;
    }
    out.remote_digest = from_wire(rep.digest());
    out.missing = from_wire_list(rep.missing());
    return out;
}

CallStatus GrpcTransport::push(const NodeInfo& peer, const std::vector<Message>& messages) {
    grpc::ClientContext ctx;
    set_deadline(&ctx);
    chatrpc::PushRequest req;
    req.set_from_node(self_id_);
    for (const auto& m : messages) {
        to_wire(m, req.add_messages());
    }
    chatrpc::PushReply rep;
    auto s = stub_for(peer)->Push(&ctx, req, &rep);
    if (!s.ok()) {
        spdlog::debug("push of {} messages to {} failed: {}", messages.size(), peer.id,
                      s.error_message());
    }
    return classify(s);
}

}  // namespace chatlog
