#include "write_strategy.hpp"

namespace chatlog {

const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::Quorum: return "quorum";
        case Mode::Gossip: return "gossip";
    }
    return "unknown";
}

const char* to_string(WriteOutcome outcome) {
    switch (outcome) {
        case WriteOutcome::Committed: return "committed";
        case WriteOutcome::Accepted: return "accepted";
        case WriteOutcome::QuorumNotReached: return "quorum_not_reached";
        case WriteOutcome::Invalid: return "invalid";
    }
    return "unknown";
}

}  // namespace chatlog
