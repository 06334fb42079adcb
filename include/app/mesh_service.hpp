#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "crypto/announce_verifier.hpp"
#include "mesh/fragment_manager.hpp"
#include "mesh/mesh_delegate.hpp"
#include "mesh/peer_directory.hpp"
#include "proto/packet.hpp"
#include "transport/itransport.hpp"

namespace app
{

// Decoded body of a NoiseIdentityAnnounce packet. The body format is owned by the
// identity layer, so the service only sees it through an IdentityDecoder.
struct IdentityAnnouncement
{
    std::string               nickname;
    std::vector<std::uint8_t> noise_public_key;
    std::vector<std::uint8_t> signing_public_key;
    std::vector<std::uint8_t> signature;
    std::vector<std::uint8_t> signed_data;
};

using IdentityDecoder =
    std::function<std::optional<IdentityAnnouncement>(const proto::Packet &packet)>;

/*
TX: send_packet -> FragmentManager::create_fragments -> proto::encode -> transport.send
RX: transport -> on_rx -> proto::decode -> route():
      FRAGMENT                -> FragmentManager (reassembled packet is routed again)
      ANNOUNCE / LEAVE        -> PeerDirectory
      NOISE_IDENTITY_ANNOUNCE -> decoder + verifier -> PeerDirectory + fingerprints
      anything else           -> delegate.on_reassembled_packet
*/
class MeshService
{
  public:
    MeshService(transport::ITransport    &t,
                mesh::FragmentManager    &fragments,
                mesh::PeerDirectory      &peers,
                crypto::AnnounceVerifier &verifier,
                const proto::SenderId    &local_id);
    ~MeshService() { stop(); }

    bool start(const transport::Settings &s);
    void stop();

    void set_delegate(mesh::MeshDelegate *d);
    void set_identity_decoder(IdentityDecoder decoder);

    bool send_packet(const proto::Packet &packet);
    bool send_announce(const std::string &nickname);
    bool send_leave();

    void on_rx(const transport::Frame &f, const std::string &address);
    // Signal strength reported by the radio for a link address.
    void on_rssi(const std::string &address, int rssi);

    const proto::SenderId &local_id() const { return local_id_; }
    std::string            local_peer_id() const { return proto::peer_id_of(local_id_); }

    std::map<std::string, std::string> address_peer_map() const;
    std::string                        debug_info() const;

    static proto::SenderId random_sender_id();

  private:
    void route(const proto::Packet &p, const std::string &peer_id);
    void handle_identity(const proto::Packet &p, const std::string &peer_id);
    void deliver(const proto::Packet &p);
    void forget_addresses_of(const std::string &peer_id);
    void prune_addresses();

    transport::ITransport    &tx_;
    mesh::FragmentManager    &fragments_;
    mesh::PeerDirectory      &peers_;
    crypto::AnnounceVerifier &verifier_;
    proto::SenderId           local_id_;

    std::atomic<mesh::MeshDelegate *> delegate_{nullptr};
    std::atomic<bool>                 started_{false};

    mutable std::mutex                 mu_;
    IdentityDecoder                    decoder_;
    std::map<std::string, std::string> address_to_peer_;
};

}  // namespace app
