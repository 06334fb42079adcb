#include <exception>
#include <utility>
#include <vector>

#include "app/mesh_service.hpp"
#include "crypto/fingerprint_registry.hpp"
#include "crypto/sodium_util.hpp"
#include "util/log.hpp"

namespace app
{

MeshService::MeshService(transport::ITransport    &t,
                         mesh::FragmentManager    &fragments,
                         mesh::PeerDirectory      &peers,
                         crypto::AnnounceVerifier &verifier,
                         const proto::SenderId    &local_id)
    : tx_(t), fragments_(fragments), peers_(peers), verifier_(verifier), local_id_(local_id)
{
}

proto::SenderId MeshService::random_sender_id()
{
    proto::SenderId id{};
    crypto::random_bytes(id.data(), id.size());
    return id;
}

bool MeshService::start(const transport::Settings &s)
{
    // in case we are restarted
    stop();

    if (!fragments_.start())
    {
        LOG_ERROR("MeshService::start: fragment cleanup failed to start");
        return false;
    }
    if (!peers_.start())
    {
        LOG_ERROR("MeshService::start: peer cleanup failed to start");
        fragments_.shutdown();
        return false;
    }

    bool ok = tx_.start(
        s, [this](const transport::Frame &f, const std::string &addr) { this->on_rx(f, addr); });
    if (!ok)
    {
        LOG_ERROR("MeshService::start: transport %s failed to start", tx_.name().c_str());
        fragments_.shutdown();
        peers_.shutdown();
        return false;
    }
    started_.store(true);
    LOG_INFO("Mesh service up: local id %s on %s", local_peer_id().c_str(), tx_.name().c_str());
    return true;
}

void MeshService::stop()
{
    if (!started_.exchange(false))
        return;
    tx_.stop();
    fragments_.shutdown();
    peers_.shutdown();

    std::lock_guard<std::mutex> lk(mu_);
    address_to_peer_.clear();
}

void MeshService::set_delegate(mesh::MeshDelegate *d)
{
    delegate_.store(d);
    peers_.set_delegate(d);
}

void MeshService::set_identity_decoder(IdentityDecoder decoder)
{
    std::lock_guard<std::mutex> lk(mu_);
    decoder_ = std::move(decoder);
}

bool MeshService::send_packet(const proto::Packet &packet)
{
    auto out = fragments_.create_fragments(packet);
    if (out.empty())
    {
        LOG_ERROR("send_packet: fragmentation failed (%zu bytes)", packet.payload.size());
        return false;
    }

    for (const auto &p : out)
    {
        auto frame = proto::encode(p);
        if (frame.empty())
        {
            LOG_ERROR("send_packet: encode failed");
            return false;
        }
        if (!tx_.send(frame))
        {
            LOG_ERROR("send_packet: transport.send failed");
            return false;
        }
    }
    return true;
}

bool MeshService::send_announce(const std::string &nickname)
{
    proto::Packet p(proto::MessageType::Announce, local_id_,
                    proto::Bytes(nickname.begin(), nickname.end()));
    return send_packet(p);
}

bool MeshService::send_leave()
{
    proto::Packet p(proto::MessageType::Leave, local_id_, {});
    return send_packet(p);
}

void MeshService::on_rx(const transport::Frame &f, const std::string &address)
{
    auto p = proto::decode(f);
    if (!p)
    {
        LOG_WARN("on_rx: dropping invalid frame (%zu bytes) from %s", f.size(), address.c_str());
        return;
    }
    if (p->sender == local_id_)
        return;  // our own packet echoed back

    const std::string peer_id = proto::peer_id_of(p->sender);
    bool              new_address;
    {
        std::lock_guard<std::mutex> lk(mu_);
        new_address = address_to_peer_.count(address) == 0;
    }
    // the map only grows here, so pruning on a new address keeps it bounded
    if (new_address)
        prune_addresses();
    {
        std::lock_guard<std::mutex> lk(mu_);
        address_to_peer_[address] = peer_id;
    }
    peers_.update_peer_last_seen(peer_id);

    if (p->is(proto::MessageType::Fragment))
    {
        auto full = fragments_.handle_incoming_fragment(*p);
        if (!full)
            return;  // waiting for more
        if (full->is(proto::MessageType::Fragment))
        {
            LOG_WARN("on_rx: nested fragment from %s dropped", peer_id.c_str());
            return;
        }
        route(*full, peer_id);
        return;
    }
    route(*p, peer_id);
}

void MeshService::on_rssi(const std::string &address, int rssi)
{
    std::string peer_id;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = address_to_peer_.find(address);
        if (it == address_to_peer_.end())
            return;
        peer_id = it->second;
    }
    peers_.update_peer_rssi(peer_id, rssi);
}

void MeshService::route(const proto::Packet &p, const std::string &peer_id)
{
    switch (static_cast<proto::MessageType>(p.type))
    {
        case proto::MessageType::Announce:
        {
            if (p.payload.empty())
            {
                LOG_DEBUG("route: empty announce from %s", peer_id.c_str());
                return;
            }
            const std::string nickname(p.payload.begin(), p.payload.end());
            peers_.add_or_update_peer(peer_id, nickname);
            return;
        }
        case proto::MessageType::Leave:
            LOG_INFO("Peer %s left", peer_id.c_str());
            peers_.remove_peer(peer_id);
            forget_addresses_of(peer_id);
            return;
        case proto::MessageType::NoiseIdentityAnnounce:
            handle_identity(p, peer_id);
            return;
        default:
            deliver(p);
            return;
    }
}

void MeshService::handle_identity(const proto::Packet &p, const std::string &peer_id)
{
    IdentityDecoder decoder;
    {
        std::lock_guard<std::mutex> lk(mu_);
        decoder = decoder_;
    }
    if (!decoder)
    {
        deliver(p);
        return;
    }

    auto ann = decoder(p);
    if (!ann)
    {
        LOG_WARN("Undecodable identity announcement from %s", peer_id.c_str());
        return;
    }

    const bool have_keys = !ann->noise_public_key.empty() && !ann->signing_public_key.empty();
    const bool verified =
        have_keys && verifier_.verify(ann->signed_data, ann->signature, ann->signing_public_key);

    if (!verified)
    {
        LOG_WARN("Identity announcement from %s failed verification", peer_id.c_str());
        if (!ann->nickname.empty())
            peers_.add_or_update_peer(peer_id, ann->nickname);
        return;
    }

    const std::string fp = crypto::fingerprint_of_key(ann->noise_public_key);
    const auto previous  = peers_.peer_id_for_fingerprint(fp);
    if (previous && *previous != peer_id)
    {
        LOG_INFO("Peer %s rotated id to %s", previous->c_str(), peer_id.c_str());
        peers_.update_peer_id_mapping(previous, peer_id, fp);
    }
    else
    {
        peers_.store_fingerprint_for_peer(peer_id, ann->noise_public_key);
    }
    peers_.update_peer_info(peer_id, ann->nickname, ann->noise_public_key,
                            ann->signing_public_key, true);
}

void MeshService::deliver(const proto::Packet &p)
{
    mesh::MeshDelegate *d = delegate_.load();
    if (!d)
        return;
    try
    {
        d->on_reassembled_packet(p);
    }
    catch (const std::exception &e)
    {
        LOG_WARN("delegate on_reassembled_packet threw: %s", e.what());
    }
    catch (...)
    {
        LOG_WARN("delegate on_reassembled_packet threw: unknown exception");
    }
}

void MeshService::forget_addresses_of(const std::string &peer_id)
{
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = address_to_peer_.begin(); it != address_to_peer_.end();)
    {
        if (it->second == peer_id)
            it = address_to_peer_.erase(it);
        else
            ++it;
    }
}

// Drops addresses whose peer the directory no longer knows (stale cleanup, id rotation).
// The directory is queried without holding mu_.
void MeshService::prune_addresses()
{
    std::map<std::string, std::string> snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot = address_to_peer_;
    }

    std::vector<std::pair<std::string, std::string>> gone;
    for (const auto &kv : snapshot)
    {
        if (!peers_.peer_info(kv.second))
            gone.emplace_back(kv.first, kv.second);
    }
    if (gone.empty())
        return;

    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &g : gone)
    {
        auto it = address_to_peer_.find(g.first);
        // remapped meanwhile; leave it
        if (it != address_to_peer_.end() && it->second == g.second)
            address_to_peer_.erase(it);
    }
    LOG_DEBUG("MeshService: pruned %zu stale address mapping(s)", gone.size());
}

std::map<std::string, std::string> MeshService::address_peer_map() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return address_to_peer_;
}

std::string MeshService::debug_info() const
{
    return peers_.debug_info_with_device_addresses(address_peer_map());
}

}  // namespace app
