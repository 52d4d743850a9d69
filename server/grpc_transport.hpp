#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>
#include "chatlog.grpc.pb.h"
#include "transport.hpp"

namespace chatlog {

// GrpcTransport talks to peers' ReplicaService. Channels and stubs are
// created lazily, one per peer address, and shared by all calling threads.
// Every RPC carries a deadline of now + call_timeout.
class GrpcTransport final : public Transport {
public:
    GrpcTransport(std::string self_id, std::chrono::milliseconds call_timeout);

    CallStatus replicate(const NodeInfo& peer, const Message& message) override;
    ExchangeResult exchange(const NodeInfo& peer, const VersionDigest& local) override;
    CallStatus push(const NodeInfo& peer, const std::vector<Message>& messages) override;

    static CallStatus classify(const grpc::Status& status);

private:
    chatrpc::ReplicaService::Stub* stub_for(const NodeInfo& peer);
    void set_deadline(grpc::ClientContext* ctx) const;

    std::string self_id_;
    std::chrono::milliseconds call_timeout_;
    std::mutex stubs_mutex_;
    std::map<std::string, std::unique_ptr<chatrpc::ReplicaService::Stub>> stubs_;
};

}  // namespace chatlog
