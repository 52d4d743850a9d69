#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chatlog {

// NodeInfo identifies one cluster member and the address its gRPC server
// listens on.
struct NodeInfo {
    std::string id;
    std::string address;
};

// ClusterView is the membership fixed at boot, self included. It never
// changes after construction.
class ClusterView {
public:
    // Throws std::invalid_argument if members is empty, contains duplicate
    // ids, or does not contain self_id.
    ClusterView(std::string self_id, std::vector<NodeInfo> members);

    const NodeInfo& self() const { return members_[self_index_]; }
    const std::vector<NodeInfo>& members() const { return members_; }
    std::vector<NodeInfo> peers() const;

    std::size_t size() const { return members_.size(); }
    // Majority of the whole cluster: floor(N/2) + 1.
    std::size_t quorum_size() const { return members_.size() / 2 + 1; }

    const NodeInfo* find(const std::string& id) const;

private:
    std::vector<NodeInfo> members_;
    std::size_t self_index_ = 0;
};

// PeerLiveness records what the last transport call to each peer observed.
// It is ephemeral and only reported through the health endpoint.
class PeerLiveness {
public:
    struct Entry {
        bool reachable = false;
        std::string last_status = "unknown";
        std::chrono::system_clock::time_point last_seen{};
    };

    void record(const std::string& peer_id, bool reachable, const std::string& status);
    Entry get(const std::string& peer_id) const;
    std::map<std::string, Entry> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}  // namespace chatlog
