#include "transport.hpp"

namespace chatlog {

const char* to_string(CallStatus status) {
    switch (status) {
        case CallStatus::Ok: return "ok";
        case CallStatus::Timeout: return "timeout";
        case CallStatus::Unreachable: return "unreachable";
        case CallStatus::Failed: return "failed";
    }
    return "unknown";
}

}  // namespace chatlog
