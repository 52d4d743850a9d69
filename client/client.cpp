#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "chatlog.grpc.pb.h"
#include "outcome_trailer.hpp"

using namespace std::chrono_literals;

// Exit codes shared by every command.
enum ExitCode {
  kOk = 0,
  kUsage = 1,
  kRpcFailed = 2,
  kQuorumFailed = 3,
};

// -------------------- Helpers --------------------

std::unique_ptr<chatrpc::ChatService::Stub> make_stub(const std::string& addr) {
  auto ch = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  return chatrpc::ChatService::NewStub(ch);
}

/*
 * set_deadline
 * Quorum writes may wait for the slowest necessary peer, so client calls
 * get a generous deadline compared to the node-to-node timeout.
 */
void set_deadline(grpc::ClientContext& ctx) {
  ctx.set_deadline(std::chrono::system_clock::now() + 10s);
}

int report_rpc_error(const char* op, const grpc::Status& s) {
  std::cout << op << " failed: " << s.error_message() << "\n";
  return kRpcFailed;
}

/*
 * quorum_not_reached
 * The node names the write outcome in trailing metadata; an UNAVAILABLE
 * without it means the node itself could not be reached.
 */
bool quorum_not_reached(const grpc::ClientContext& ctx) {
  const auto& trailers = ctx.GetServerTrailingMetadata();
  auto it = trailers.find(chatlog::kWriteOutcomeTrailer);
  return it != trailers.end() &&
         it->second == grpc::string_ref(chatlog::kQuorumNotReachedOutcome);
}

void print_message(const chatrpc::WireMessage& m) {
  std::cout << "[" << m.id() << "] " << m.user() << ": " << m.text()
            << " (origin=" << m.origin_node() << " v" << m.version()
            << " at=" << m.accepted_at_ms() << ")\n";
}

// -------------------- Commands --------------------

/*
 * do_post
 * Submits one message. Quorum nodes answer COMMITTED with the number of
 * acknowledging replicas; gossip nodes answer ACCEPTED right away.
 */
int do_post(chatrpc::ChatService::Stub* stub, const std::string& user, const std::string& text) {
  grpc::ClientContext ctx;
  set_deadline(ctx);
  chatrpc::PostMessageRequest req;
  req.set_user(user);
  req.set_text(text);
  chatrpc::PostMessageReply rep;
  auto s = stub->PostMessage(&ctx, req, &rep);
  if (!s.ok()) {
    report_rpc_error("POST", s);
    return quorum_not_reached(ctx) ? kQuorumFailed : kRpcFailed;
  }

  if (rep.status() == chatrpc::COMMITTED) {
    std::cout << "POST committed (mode=" << rep.mode() << ", replicas=" << rep.replicas()
              << ")\n";
  } else {
    std::cout << "POST accepted (mode=" << rep.mode() << ", propagation in progress)\n";
  }
  print_message(rep.message());
  return kOk;
}

int do_list(chatrpc::ChatService::Stub* stub) {
  grpc::ClientContext ctx;
  set_deadline(ctx);
  chatrpc::ListMessagesRequest req;
  chatrpc::ListMessagesReply rep;
  auto s = stub->ListMessages(&ctx, req, &rep);
  if (!s.ok()) return report_rpc_error("LIST", s);

  std::cout << rep.count() << " messages on node " << rep.node_id();
  if (rep.local_only()) std::cout << " (local view, may be stale)";
  std::cout << "\n";
  for (const auto& m : rep.messages()) print_message(m);
  return kOk;
}

int do_health(chatrpc::ChatService::Stub* stub) {
  grpc::ClientContext ctx;
  set_deadline(ctx);
  chatrpc::HealthRequest req;
  chatrpc::HealthReply rep;
  auto s = stub->Health(&ctx, req, &rep);
  if (!s.ok()) return report_rpc_error("HEALTH", s);

  std::cout << "node=" << rep.node_id() << " status=" << rep.status() << " mode=" << rep.mode()
            << " N=" << rep.cluster_size() << " quorum=" << rep.quorum_size()
            << " messages=" << rep.message_count() << "\n";
  for (const auto& p : rep.peers()) {
    std::cout << "  peer " << p.node_id() << " @ " << p.address() << ": "
              << (p.reachable() ? "reachable" : "unreachable") << " (" << p.last_status()
              << ")\n";
  }
  return kOk;
}

// -------------------- main() --------------------

/*
 * main
 * Dispatches the requested command against a single node.
 */
int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage:\n"
              << "  ./chatlog_client <host:port> post <user> <text...>\n"
              << "  ./chatlog_client <host:port> list\n"
              << "  ./chatlog_client <host:port> health\n";
    return kUsage;
  }

  auto stub = make_stub(argv[1]);
  std::string op = argv[2];

  if (op == "post") {
    if (argc < 5) {
      std::cerr << "post needs <user> <text...>\n";
      return kUsage;
    }
    std::string text = argv[4];
    for (int i = 5; i < argc; ++i) {
      text += " ";
      text += argv[i];
    }
    return do_post(stub.get(), argv[3], text);

  } else if (op == "list") {
    return do_list(stub.get());

  } else if (op == "health") {
    return do_health(stub.get());

  } else {
    std::cerr << "unknown op\n";
    return kUsage;
  }
}
