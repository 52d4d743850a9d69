#pragma once
#include <cstddef>
#include <string>

#include "message.hpp"

namespace chatlog {

// Consistency protocol a node runs for client writes. Fixed at boot.
enum class Mode {
    Quorum,  // synchronous majority acknowledgement (CP)
    Gossip,  // local accept, anti-entropy propagation (AP)
};

enum class WriteOutcome {
    Committed,
    Accepted,
    QuorumNotReached,
    Invalid,
};

const char* to_string(Mode mode);
const char* to_string(WriteOutcome outcome);

// WriteResult summarises one client write. acks/required are only
// meaningful for quorum writes; a gossip write reports the local ack alone.
struct WriteResult {
    WriteOutcome outcome = WriteOutcome::Invalid;
    Message message;
    std::size_t acks = 0;
    std::size_t required = 0;
    std::size_t cluster_size = 0;
    std::string detail;

    bool ok() const {
        return outcome == WriteOutcome::Committed || outcome == WriteOutcome::Accepted;
    }
};

// WriteStrategy is the per-mode write path. The message handed in has
// already been validated and stamped with its origin identity.
class WriteStrategy {
public:
    virtual ~WriteStrategy() = default;
    virtual WriteResult write(const Message& message) = 0;
};

}  // namespace chatlog
