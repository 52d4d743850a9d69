#include "node_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace chatlog {

const char* const kNodeUsage =
    "Usage: ./chatlog_node <node_id> <cluster_file> <quorum|gossip> "
    "[gossip_interval_ms] [rpc_timeout_ms] [gossip_fanout] [decision_grace_ms]\n"
    "  gossip_fanout 0 contacts every peer each round\n";

namespace {

long long parse_count(const std::string& text, const char* what) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(what) + " is not a number: '" + text + "'");
    }
    if (used != text.size() || value < 0) {
        throw ConfigError(std::string(what) + " must be a non-negative integer: '" + text + "'");
    }
    return value;
}

std::chrono::milliseconds parse_millis(const std::string& text, const char* what) {
    long long value = parse_count(text, what);
    if (value == 0) {
        throw ConfigError(std::string(what) + " must be a positive integer: '" + text + "'");
    }
    return std::chrono::milliseconds(value);
}

}  // namespace

CoordinatorOptions NodeConfig::coordinator_options() const {
    CoordinatorOptions options;
    options.mode = mode;
    options.quorum.call_timeout = rpc_timeout;
    options.quorum.decision_grace = decision_grace;
    options.gossip.fanout = gossip_fanout;
    return options;
}

SchedulerOptions NodeConfig::scheduler_options() const {
    SchedulerOptions options;
    options.interval = gossip_interval;
    options.jitter = gossip_jitter;
    return options;
}

std::vector<NodeInfo> parse_cluster_lines(std::istream& in) {
    std::vector<NodeInfo> members;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::istringstream fields(line);
        std::string first, second, extra;
        if (!(fields >> first) || first[0] == '#') continue;
        fields >> second;
        if (fields >> extra) {
            throw ConfigError("cluster file line " + std::to_string(lineno) +
                              ": expected '<node_id> <host:port>'");
        }
        if (second.empty()) {
            members.push_back(NodeInfo{first, first});
        } else {
            members.push_back(NodeInfo{first, second});
        }
    }
    return members;
}

std::vector<NodeInfo> load_cluster_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open cluster file '" + path + "'");
    }
    auto members = parse_cluster_lines(in);
    if (members.empty()) {
        throw ConfigError("cluster file '" + path + "' lists no nodes");
    }
    return members;
}

Mode parse_mode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "quorum" || lower == "strong") return Mode::Quorum;
    if (lower == "gossip" || lower == "eventual") return Mode::Gossip;
    throw ConfigError("unknown mode '" + text + "' (expected quorum or gossip)");
}

NodeConfig parse_node_config(int argc, char** argv) {
    if (argc < 4 || argc > 8) {
        throw ConfigError(kNodeUsage);
    }
    NodeConfig config;
    config.node_id = argv[1];
    config.members = load_cluster_file(argv[2]);
    config.mode = parse_mode(argv[3]);
    if (argc > 4) {
        config.gossip_interval = parse_millis(argv[4], "gossip_interval_ms");
        config.gossip_jitter = config.gossip_interval / 2;
    }
    if (argc > 5) {
        config.rpc_timeout = parse_millis(argv[5], "rpc_timeout_ms");
    }
    if (argc > 6) {
        config.gossip_fanout = static_cast<std::size_t>(parse_count(argv[6], "gossip_fanout"));
    }
    if (argc > 7) {
        config.decision_grace =
            std::chrono::milliseconds(parse_count(argv[7], "decision_grace_ms"));
    }

    bool found_self = std::any_of(config.members.begin(), config.members.end(),
                                  [&](const NodeInfo& n) { return n.id == config.node_id; });
    if (!found_self) {
        throw ConfigError("node '" + config.node_id + "' is not listed in '" +
                          std::string(argv[2]) + "'");
    }
    return config;
}

}  // namespace chatlog
