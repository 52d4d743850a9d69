#include "message.hpp"

#include <chrono>

namespace chatlog {

std::string origin_stream(const std::string& origin_node, uint64_t incarnation) {
    return origin_node + ":" + std::to_string(incarnation);
}

std::string origin_stream(const Message& message) {
    return origin_stream(message.origin_node, message.incarnation);
}

std::string make_message_id(const std::string& origin_node, uint64_t incarnation,
                            uint64_t version) {
    return origin_stream(origin_node, incarnation) + ":" + std::to_string(version);
}

bool has_coherent_identity(const Message& message) {
    return !message.origin_node.empty() && message.incarnation != 0 && message.version != 0 &&
           message.id ==
               make_message_id(message.origin_node, message.incarnation, message.version);
}

bool same_message(const Message& a, const Message& b) {
    return a.id == b.id && a.text == b.text && a.user == b.user &&
           a.origin_node == b.origin_node && a.incarnation == b.incarnation &&
           a.version == b.version && a.accepted_at_ms == b.accepted_at_ms;
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace chatlog
