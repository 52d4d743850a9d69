#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace chatlog {

// Message is one immutable entry of the replicated log. It is created at its
// origin node and only ever copied afterwards.
//
// `incarnation` identifies one process lifetime of the origin node, so a
// restarted node never reuses the ids of its previous run. Versions count
// from 1 within each incarnation.
struct Message {
    std::string id;
    std::string text;
    std::string user;
    std::string origin_node;
    uint64_t incarnation = 0;
    uint64_t version = 0;
    int64_t accepted_at_ms = 0;
};

// VersionDigest maps an origin stream (see origin_stream) to the highest
// version v such that every version 1..v from that stream is held locally.
using VersionDigest = std::map<std::string, uint64_t>;

// origin_stream names the writer stream of one node incarnation,
// "<node>:<incarnation>".
std::string origin_stream(const std::string& origin_node, uint64_t incarnation);
std::string origin_stream(const Message& message);

// make_message_id derives the globally unique id "<node>:<incarnation>:<version>".
std::string make_message_id(const std::string& origin_node, uint64_t incarnation,
                            uint64_t version);

// has_coherent_identity reports whether a message's id matches its origin,
// incarnation and version; peers refuse replicas that fail this check.
bool has_coherent_identity(const Message& message);

// same_message compares every field; two copies of one logical message
// always agree.
bool same_message(const Message& a, const Message& b);

int64_t now_millis();

}  // namespace chatlog
