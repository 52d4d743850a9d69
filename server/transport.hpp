#pragma once
#include <vector>

#include "cluster_view.hpp"
#include "message.hpp"

namespace chatlog {

// Outcome of a single inter-node call. Anything but Ok is a failure the
// caller must account for; a timeout is never reported as success.
enum class CallStatus {
    Ok,
    Timeout,
    Unreachable,
    Failed,
};

const char* to_string(CallStatus status);

// ExchangeResult is the peer's half of a push-pull gossip exchange: its own
// digest and every message it holds above the digest we sent.
struct ExchangeResult {
    CallStatus status = CallStatus::Failed;
    VersionDigest remote_digest;
    std::vector<Message> missing;
};

// Transport is the inter-node RPC seam shared by both replication
// strategies. Implementations bound every call by their own timeout and
// must be safe to call from many threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    virtual CallStatus replicate(const NodeInfo& peer, const Message& message) = 0;
    virtual ExchangeResult exchange(const NodeInfo& peer, const VersionDigest& local) = 0;
    virtual CallStatus push(const NodeInfo& peer, const std::vector<Message>& messages) = 0;
};

}  // namespace chatlog
