#include "message_store.hpp"

#include <iterator>

namespace chatlog {

bool MessageStore::append(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(message.id) != 0) {
        return false;
    }
    index_.emplace(message.id, log_.size());
    log_.push_back(message);
    advance(origins_[origin_stream(message)], message.version);
    return true;
}

void MessageStore::advance(OriginVersions& origin, uint64_t version) {
    if (version > origin.highest) {
        origin.highest = version;
    }
    if (version <= origin.contiguous) {
        return;
    }
    if (version == origin.contiguous + 1) {
        origin.contiguous = version;
        auto first = origin.ahead.begin();
        if (first != origin.ahead.end() && first->first == origin.contiguous + 1) {
            origin.contiguous = first->second;
            origin.ahead.erase(first);
        }
        return;
    }

    // Early arrival: merge [version, version] with its neighbouring ranges.
    uint64_t lo = version;
    uint64_t hi = version;
    auto next = origin.ahead.lower_bound(version);
    if (next != origin.ahead.begin()) {
        auto prev = std::prev(next);
        if (prev->second >= version) {
            return;
        }
        if (prev->second + 1 == version) {
            lo = prev->first;
            origin.ahead.erase(prev);
        }
    }
    if (next != origin.ahead.end() && next->first == version + 1) {
        hi = next->second;
        origin.ahead.erase(next);
    }
    origin.ahead.emplace(lo, hi);
}

std::vector<Message> MessageStore::list_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

bool MessageStore::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(id) != 0;
}

std::optional<Message> MessageStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return log_[it->second];
}

std::size_t MessageStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

std::optional<uint64_t> MessageStore::highest_version(const std::string& stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = origins_.find(stream);
    if (it == origins_.end()) {
        return std::nullopt;
    }
    return it->second.highest;
}

VersionDigest MessageStore::digest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    VersionDigest out;
    for (const auto& entry : origins_) {
        out.emplace(entry.first, entry.second.contiguous);
    }
    return out;
}

std::vector<Message> MessageStore::messages_since(const VersionDigest& digest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> out;
    for (const auto& message : log_) {
        auto it = digest.find(origin_stream(message));
        if (it == digest.end() || message.version > it->second) {
            out.push_back(message);
        }
    }
    return out;
}

std::size_t MessageStore::pending_ranges(const std::string& stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = origins_.find(stream);
    return it == origins_.end() ? 0 : it->second.ahead.size();
}

}  // namespace chatlog
