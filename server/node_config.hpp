#pragma once
#include <chrono>
#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cluster_view.hpp"
#include "gossip_scheduler.hpp"
#include "replication_coordinator.hpp"

namespace chatlog {

// Raised for any problem with the command line or the cluster file.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// NodeConfig is read once at process start and never changes afterwards.
struct NodeConfig {
    std::string node_id;
    std::vector<NodeInfo> members;
    Mode mode = Mode::Quorum;
    std::chrono::milliseconds gossip_interval{1000};
    std::chrono::milliseconds gossip_jitter{500};
    std::chrono::milliseconds rpc_timeout{2000};
    std::chrono::milliseconds decision_grace{250};
    std::size_t gossip_fanout = 0;

    CoordinatorOptions coordinator_options() const;
    SchedulerOptions scheduler_options() const;
};

// Cluster files list one member per line as "<node_id> <host:port>" or just
// "<host:port>", in which case the address doubles as the id. Blank lines
// and lines starting with '#' are ignored.
std::vector<NodeInfo> parse_cluster_lines(std::istream& in);
std::vector<NodeInfo> load_cluster_file(const std::string& path);

// Accepts quorum/strong and gossip/eventual in any case.
Mode parse_mode(const std::string& text);

// argv: <node_id> <cluster_file> <quorum|gossip> [gossip_interval_ms] [rpc_timeout_ms]
//       [gossip_fanout] [decision_grace_ms]
NodeConfig parse_node_config(int argc, char** argv);

extern const char* const kNodeUsage;

}  // namespace chatlog
