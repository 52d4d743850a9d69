#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "message.hpp"

namespace chatlog {

// MessageStore is the per-node append-only log. Entries are deduplicated by
// id and listed in local insertion order. Everything is guarded by a single
// mutex, so readers never see a half-inserted message.
//
// Version bookkeeping is per origin stream, "<node>:<incarnation>".
class MessageStore {
public:
    // append inserts the message unless its id is already present. Returns
    // false for a duplicate, which callers treat as a successful no-op.
    bool append(const Message& message);

    std::vector<Message> list_all() const;
    bool contains(const std::string& id) const;
    std::optional<Message> find(const std::string& id) const;
    std::size_t size() const;

    // highest_version is the largest version seen from the origin stream,
    // or nullopt when nothing from that stream has been stored yet.
    std::optional<uint64_t> highest_version(const std::string& stream) const;

    // digest summarises the store as gap-free per-stream watermarks.
    VersionDigest digest() const;

    // messages_since returns, in insertion order, every message above the
    // watermark the digest records for its stream. Streams missing from the
    // digest contribute all of their messages.
    std::vector<Message> messages_since(const VersionDigest& digest) const;

    // Number of disjoint version ranges of the stream held above its
    // watermark. A version that never arrives (a rejected quorum write)
    // costs one range, however many later versions follow it.
    std::size_t pending_ranges(const std::string& stream) const;

private:
    // Versions above the contiguous watermark are kept as closed ranges
    // [first, second] until the gap below them closes.
    struct OriginVersions {
        uint64_t highest = 0;
        uint64_t contiguous = 0;
        std::map<uint64_t, uint64_t> ahead;
    };

    void advance(OriginVersions& origin, uint64_t version);

    mutable std::mutex mutex_;
    std::vector<Message> log_;
    std::unordered_map<std::string, std::size_t> index_;
    std::map<std::string, OriginVersions> origins_;
};

}  // namespace chatlog
