#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "gossip_scheduler.hpp"
#include "grpc_transport.hpp"
#include "node_config.hpp"
#include "replication_coordinator.hpp"
#include "services.hpp"

using grpc::Server;
using grpc::ServerBuilder;

using namespace chatlog;

namespace {

// Signal handling only records the request; the watcher thread below does
// the actual shutdown outside of signal context.
volatile std::sig_atomic_t g_shutdown_requested = 0;

void on_signal(int) { g_shutdown_requested = 1; }

}  // namespace

// RunServer boots one cluster node: coordinator, gRPC services on the
// node's own address, and the gossip scheduler when running in gossip mode.
// It blocks until SIGINT/SIGTERM.
int RunServer(const NodeConfig& config) {
    auto transport = std::make_shared<GrpcTransport>(config.node_id, config.rpc_timeout);
    ReplicationCoordinator coordinator(ClusterView(config.node_id, config.members), transport,
                                       config.coordinator_options());
    ChatServiceImpl chat(&coordinator);
    ReplicaServiceImpl replica(&coordinator);

    const std::string& address = coordinator.cluster().self().address;
    ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&chat);
    builder.RegisterService(&replica);

    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("Node {} could not listen on {}", config.node_id, address);
        return 1;
    }
    spdlog::info("Node {} running at {} (mode={}, N={}, quorum={})", config.node_id, address,
                 to_string(config.mode), coordinator.cluster().size(),
                 coordinator.cluster().quorum_size());

    std::unique_ptr<GossipScheduler> scheduler;
    if (coordinator.gossip() != nullptr) {
        scheduler = std::make_unique<GossipScheduler>(*coordinator.gossip(),
                                                      config.scheduler_options());
        scheduler->start();
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::thread watcher([&server] {
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        server->Shutdown();
    });

    server->Wait();
    watcher.join();
    if (scheduler) scheduler->stop();
    spdlog::info("Node {} stopped with {} messages", config.node_id,
                 coordinator.store().size());
    return 0;
}

// Entry point: parses configuration and starts the node.
int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();
    try {
        NodeConfig config = parse_node_config(argc, argv);
        return RunServer(config);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        spdlog::error("invalid cluster: {}", e.what());
        return 1;
    }
}
