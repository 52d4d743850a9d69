#pragma once
#include <vector>

#include "chatlog.pb.h"
#include "message.hpp"

namespace chatlog {

// Conversions between domain types and their protobuf wire form.

void to_wire(const Message& in, chatrpc::WireMessage* out);
Message from_wire(const chatrpc::WireMessage& in);

void to_wire(const VersionDigest& in, chatrpc::Digest* out);
VersionDigest from_wire(const chatrpc::Digest& in);

template <typename RepeatedField>
std::vector<Message> from_wire_list(const RepeatedField& in) {
    std::vector<Message> out;
    out.reserve(in.size());
    for (const auto& m : in) out.push_back(from_wire(m));
    return out;
}

}  // namespace chatlog
