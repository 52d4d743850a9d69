#pragma once

namespace chatlog {

// PostMessage attaches the write outcome to every reply as trailing
// metadata, so clients can tell a failed quorum apart from an unreachable
// node without parsing status messages. Values are to_string(WriteOutcome).
constexpr char kWriteOutcomeTrailer[] = "chatlog-write-outcome";
constexpr char kQuorumNotReachedOutcome[] = "quorum_not_reached";

}  // namespace chatlog
