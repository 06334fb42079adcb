#pragma once
#include <string>
#include <vector>

#include "proto/packet.hpp"

namespace mesh
{

// Application-side observer. Callbacks run synchronously on the thread that caused the
// event (rx path or a maintenance thread) and never while a component lock is held.
struct MeshDelegate
{
    virtual void on_reassembled_packet(const proto::Packet & /*packet*/) {}
    virtual void on_peer_list_updated(const std::vector<std::string> & /*active_peer_ids*/) {}
    virtual void on_peer_removed(const std::string & /*peer_id*/) {}
    virtual ~MeshDelegate() = default;
};

}  // namespace mesh
