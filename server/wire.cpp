#include "wire.hpp"

namespace chatlog {

void to_wire(const Message& in, chatrpc::WireMessage* out) {
    out->set_id(in.id);
    out->set_text(in.text);
    out->set_user(in.user);
    out->set_origin_node(in.origin_node);
    out->set_incarnation(in.incarnation);
    out->set_version(in.version);
    out->set_accepted_at_ms(in.accepted_at_ms);
}

Message from_wire(const chatrpc::WireMessage& in) {
    Message m;
    m.id = in.id();
    m.text = in.text();
    m.user = in.user();
    m.origin_node = in.origin_node();
    m.incarnation = in.incarnation();
    m.version = in.version();
    m.accepted_at_ms = in.accepted_at_ms();
    return m;
}

void to_wire(const VersionDigest& in, chatrpc::Digest* out) {
    auto* watermarks = out->mutable_watermarks();
    for (const auto& entry : in) {
        (*watermarks)[entry.first] = entry.second;
    }
}

VersionDigest from_wire(const chatrpc::Digest& in) {
    VersionDigest out;
    for (const auto& entry : in.watermarks()) {
        out.emplace(entry.first, entry.second);
    }
    return out;
}

}  // namespace chatlog
