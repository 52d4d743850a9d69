#pragma once
#include <grpcpp/grpcpp.h>
#include "chatlog.grpc.pb.h"
#include "replication_coordinator.hpp"

namespace chatlog {

// ChatServiceImpl is the client-facing front end. It maps coordinator
// results onto replies and gRPC status codes.
class ChatServiceImpl final : public chatrpc::ChatService::Service {
public:
    explicit ChatServiceImpl(ReplicationCoordinator* coordinator) : coordinator_(coordinator) {}

    grpc::Status PostMessage(grpc::ServerContext* ctx, const chatrpc::PostMessageRequest* req,
                             chatrpc::PostMessageReply* reply) override;
    grpc::Status ListMessages(grpc::ServerContext*, const chatrpc::ListMessagesRequest*,
                              chatrpc::ListMessagesReply* reply) override;
    grpc::Status Health(grpc::ServerContext*, const chatrpc::HealthRequest*,
                        chatrpc::HealthReply* reply) override;

private:
    ReplicationCoordinator* coordinator_;
};

// ReplicaServiceImpl is the receiving end of GrpcTransport.
class ReplicaServiceImpl final : public chatrpc::ReplicaService::Service {
public:
    explicit ReplicaServiceImpl(ReplicationCoordinator* coordinator) : coordinator_(coordinator) {}

    grpc::Status Replicate(grpc::ServerContext*, const chatrpc::ReplicateRequest* req,
                           chatrpc::ReplicateReply* reply) override;
    grpc::Status Exchange(grpc::ServerContext*, const chatrpc::ExchangeRequest* req,
                          chatrpc::ExchangeReply* reply) override;
    grpc::Status Push(grpc::ServerContext*, const chatrpc::PushRequest* req,
                      chatrpc::PushReply* reply) override;

private:
    ReplicationCoordinator* coordinator_;
};

}  // namespace chatlog
