#include "cluster_view.hpp"

#include <set>
#include <stdexcept>

namespace chatlog {

ClusterView::ClusterView(std::string self_id, std::vector<NodeInfo> members)
    : members_(std::move(members)) {
    if (members_.empty()) {
        throw std::invalid_argument("cluster membership is empty");
    }
    std::set<std::string> seen;
    bool found_self = false;
    for (std::size_t i = 0; i < members_.size(); ++i) {
        if (!seen.insert(members_[i].id).second) {
            throw std::invalid_argument("duplicate node id '" + members_[i].id + "'");
        }
        if (members_[i].id == self_id) {
            self_index_ = i;
            found_self = true;
        }
    }
    if (!found_self) {
        throw std::invalid_argument("node '" + self_id + "' is not a cluster member");
    }
}

std::vector<NodeInfo> ClusterView::peers() const {
    std::vector<NodeInfo> out;
    out.reserve(members_.size() - 1);
    for (std::size_t i = 0; i < members_.size(); ++i) {
        if (i != self_index_) out.push_back(members_[i]);
    }
    return out;
}

const NodeInfo* ClusterView::find(const std::string& id) const {
    for (const auto& m : members_) {
        if (m.id == id) return &m;
    }
    return nullptr;
}

void PeerLiveness::record(const std::string& peer_id, bool reachable, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& e = entries_[peer_id];
    e.reachable = reachable;
    e.last_status = status;
    e.last_seen = std::chrono::system_clock::now();
}

PeerLiveness::Entry PeerLiveness::get(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(peer_id);
    return it == entries_.end() ? Entry{} : it->second;
}

std::map<std::string, PeerLiveness::Entry> PeerLiveness::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

}  // namespace chatlog
