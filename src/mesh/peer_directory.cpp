#include <algorithm>
#include <exception>
#include <sstream>
#include <utility>

#include "mesh/peer_directory.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace mesh
{

static bool is_unknown(const std::string &peer_id)
{
    return peer_id.empty() || peer_id == constants::UNKNOWN_PEER_ID;
}

PeerDirectory::PeerDirectory(crypto::FingerprintRegistry &fingerprints,
                             const util::Config          &cfg,
                             util::Clock                  clock)
    : fingerprints_(fingerprints),
      cfg_(cfg),
      clock_(std::move(clock)),
      cleanup_task_("peer-cleanup", cfg.peer_cleanup_interval, [this] { cleanup_stale_peers(); })
{
}

bool PeerDirectory::start()
{
    return cleanup_task_.start();
}

void PeerDirectory::shutdown()
{
    cleanup_task_.stop();
    clear_all_peers();
}

bool PeerDirectory::update_peer_info(const std::string &peer_id,
                                     const std::string &nickname,
                                     const KeyBytes    &noise_public_key,
                                     const KeyBytes    &signing_public_key,
                                     bool               verified)
{
    if (is_unknown(peer_id))
        return false;

    bool                     newly_verified = false;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const auto                  now = clock_();
        auto                        it  = peers_.find(peer_id);

        if (it != peers_.end() && it->second.verified && !verified)
        {
            // keep the verified identity, only refresh liveness
            it->second.last_seen = now;
            it->second.connected = true;
            LOG_WARN("Unverified announcement for verified peer %s ignored", peer_id.c_str());
            return false;
        }

        const bool was_verified = it != peers_.end() && it->second.verified;

        PeerRecord rec;
        rec.id                 = peer_id;
        rec.nickname           = nickname;
        rec.connected          = true;
        rec.direct_connection  = it != peers_.end() ? it->second.direct_connection : false;
        rec.noise_public_key   = noise_public_key;
        rec.signing_public_key = signing_public_key;
        rec.verified           = verified;
        rec.last_seen          = now;
        peers_[peer_id]        = std::move(rec);

        if (verified && !was_verified)
        {
            announced_.insert(peer_id);
            newly_verified = true;
            ids            = active_ids_locked(now);
        }
    }

    if (newly_verified)
    {
        LOG_INFO("New verified peer: %s (%s)", nickname.c_str(), peer_id.c_str());
        notify_peer_list(ids);
        return true;
    }
    if (verified)
        LOG_DEBUG("Updated verified peer: %s (%s)", nickname.c_str(), peer_id.c_str());
    else
        LOG_DEBUG("Unverified peer announcement from: %s (%s)", nickname.c_str(), peer_id.c_str());
    return false;
}

bool PeerDirectory::add_or_update_peer(const std::string &peer_id, const std::string &nickname)
{
    if (is_unknown(peer_id))
        return false;

    bool                     first_announce = false;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const auto                  now = clock_();

        // Same nickname under another id: the peer most likely rotated its ephemeral id.
        std::vector<std::string> stale;
        for (const auto &kv : peers_)
        {
            if (kv.first == peer_id || kv.second.nickname != nickname)
                continue;
            if (now - kv.second.last_seen >= cfg_.recently_seen_window)
                stale.push_back(kv.first);
        }
        for (const auto &id : stale)
        {
            LOG_DEBUG("Dropping stale id %s for nickname '%s'", id.c_str(), nickname.c_str());
            remove_locked(id);
        }

        first_announce = announced_.count(peer_id) == 0;

        auto it = peers_.find(peer_id);
        if (it != peers_.end())
        {
            it->second.nickname  = nickname;
            it->second.last_seen = now;
            it->second.connected = true;
        }
        else
        {
            PeerRecord rec;
            rec.id          = peer_id;
            rec.nickname    = nickname;
            rec.connected   = true;
            rec.last_seen   = now;
            peers_[peer_id] = std::move(rec);
        }

        if (first_announce)
        {
            announced_.insert(peer_id);
            ids = active_ids_locked(now);
        }
    }

    if (first_announce)
    {
        LOG_INFO("New peer: %s (%s)", nickname.c_str(), peer_id.c_str());
        notify_peer_list(ids);
        return true;
    }
    LOG_DEBUG("Updated peer: %s (%s)", peer_id.c_str(), nickname.c_str());
    return false;
}

void PeerDirectory::set_direct_connection(const std::string &peer_id, bool direct)
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = peers_.find(peer_id);
        if (it == peers_.end() || it->second.direct_connection == direct)
            return;
        it->second.direct_connection = direct;
        ids                          = active_ids_locked(clock_());
    }
    notify_peer_list(ids);
}

void PeerDirectory::update_peer_last_seen(const std::string &peer_id)
{
    if (is_unknown(peer_id))
        return;
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = peers_.find(peer_id);
    if (it != peers_.end())
        it->second.last_seen = clock_();
}

void PeerDirectory::update_peer_rssi(const std::string &peer_id, int rssi)
{
    if (is_unknown(peer_id))
        return;
    std::lock_guard<std::mutex> lk(mu_);
    rssi_[peer_id] = rssi;
}

void PeerDirectory::mark_peer_announced_to(const std::string &peer_id)
{
    if (is_unknown(peer_id))
        return;
    std::lock_guard<std::mutex> lk(mu_);
    announced_to_.insert(peer_id);
}

void PeerDirectory::remove_peer(const std::string &peer_id, bool notify)
{
    bool                     removed = false;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        removed = remove_locked(peer_id);
        if (removed && notify)
            ids = active_ids_locked(clock_());
    }

    if (removed && notify)
    {
        notify_removed(peer_id);
        notify_peer_list(ids);
    }
}

void PeerDirectory::clear_all_peers()
{
    std::lock_guard<std::mutex> lk(mu_);
    peers_.clear();
    rssi_.clear();
    announced_.clear();
    announced_to_.clear();
}

std::size_t PeerDirectory::cleanup_stale_peers()
{
    std::vector<std::string> stale;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const auto                  now = clock_();
        for (const auto &kv : peers_)
        {
            if (now - kv.second.last_seen > cfg_.stale_peer_timeout)
                stale.push_back(kv.first);
        }
        std::sort(stale.begin(), stale.end());
        for (const auto &id : stale)
        {
            LOG_DEBUG("Removing stale peer: %s", id.c_str());
            remove_locked(id);
        }

        // side-table entries for ids that never got a record
        for (auto it = rssi_.begin(); it != rssi_.end();)
        {
            if (peers_.count(it->first) == 0)
                it = rssi_.erase(it);
            else
                ++it;
        }
        for (auto it = announced_to_.begin(); it != announced_to_.end();)
        {
            if (peers_.count(*it) == 0)
                it = announced_to_.erase(it);
            else
                ++it;
        }

        if (!stale.empty())
            ids = active_ids_locked(now);
    }

    if (stale.empty())
        return 0;

    for (const auto &id : stale)
        notify_removed(id);
    notify_peer_list(ids);
    LOG_INFO("Cleaned up %zu stale peers", stale.size());
    return stale.size();
}

std::optional<PeerRecord> PeerDirectory::peer_info(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = peers_.find(peer_id);
    if (it == peers_.end())
        return std::nullopt;
    return it->second;
}

bool PeerDirectory::is_peer_verified(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = peers_.find(peer_id);
    return it != peers_.end() && it->second.verified;
}

std::map<std::string, PeerRecord> PeerDirectory::verified_peers() const
{
    std::lock_guard<std::mutex>       lk(mu_);
    std::map<std::string, PeerRecord> out;
    for (const auto &kv : peers_)
    {
        if (kv.second.verified)
            out.emplace(kv.first, kv.second);
    }
    return out;
}

bool PeerDirectory::is_peer_active(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = peers_.find(peer_id);
    return it != peers_.end() && active_locked(it->second, clock_());
}

std::vector<std::string> PeerDirectory::active_peer_ids() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return active_ids_locked(clock_());
}

std::size_t PeerDirectory::active_peer_count() const
{
    return active_peer_ids().size();
}

bool PeerDirectory::has_announced_to_peer(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return announced_to_.count(peer_id) != 0;
}

std::optional<int> PeerDirectory::peer_rssi(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = rssi_.find(peer_id);
    if (it == rssi_.end())
        return std::nullopt;
    return it->second;
}

std::map<std::string, int> PeerDirectory::all_peer_rssi() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return {rssi_.begin(), rssi_.end()};
}

std::optional<std::string> PeerDirectory::peer_nickname(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = peers_.find(peer_id);
    if (it == peers_.end())
        return std::nullopt;
    return it->second.nickname;
}

std::map<std::string, std::string> PeerDirectory::all_peer_nicknames() const
{
    std::lock_guard<std::mutex>        lk(mu_);
    std::map<std::string, std::string> out;
    for (const auto &kv : peers_)
        out.emplace(kv.first, kv.second.nickname);
    return out;
}

std::size_t PeerDirectory::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peers_.size();
}

std::string PeerDirectory::debug_info(const AddressPeerMap &address_peer_map) const
{
    std::lock_guard<std::mutex> lk(mu_);
    const auto                  now    = clock_();
    const auto                  active = active_ids_locked(now);

    std::map<std::string, const PeerRecord *> sorted;
    for (const auto &kv : peers_)
        sorted.emplace(kv.first, &kv.second);

    std::ostringstream ss;
    ss << "=== Peer Directory Debug Info ===\n";
    ss << "Active Peers: " << active.size() << "\n";
    for (const auto &kv : sorted)
    {
        const PeerRecord &info = *kv.second;
        const auto        secs =
            std::chrono::duration_cast<std::chrono::seconds>(now - info.last_seen).count();

        std::string device = "Unknown";
        for (const auto &ap : address_peer_map)
        {
            if (ap.second == kv.first)
            {
                device = ap.first;
                break;
            }
        }

        const bool is_active = std::binary_search(active.begin(), active.end(), kv.first);
        auto       r         = rssi_.find(kv.first);

        ss << "  - " << kv.first << " (" << info.nickname << ") [Device: " << device << "] - "
           << (is_active ? "ACTIVE" : "INACTIVE") << "/"
           << (info.direct_connection ? "DIRECT" : "ROUTED") << ", last seen " << secs
           << "s ago, RSSI: ";
        if (r != rssi_.end())
            ss << r->second << " dBm";
        else
            ss << "No RSSI";
        ss << (info.verified ? ", verified" : "") << "\n";
    }
    ss << "Announced Peers: " << announced_.size() << "\n";
    ss << "Announced To Peers: " << announced_to_.size() << "\n";
    return ss.str();
}

std::string PeerDirectory::debug_info_with_device_addresses(
    const AddressPeerMap &address_peer_map) const
{
    std::ostringstream ss;
    ss << "=== Device Address to Peer Mapping ===\n";
    if (address_peer_map.empty())
    {
        ss << "No device address mappings available\n";
    }
    else
    {
        for (const auto &ap : address_peer_map)
        {
            const auto nick = peer_nickname(ap.second);
            ss << "  Device: " << ap.first << " -> Peer: " << ap.second << " ("
               << (nick ? *nick : std::string("Unknown")) << ") ["
               << (is_peer_active(ap.second) ? "ACTIVE" : "INACTIVE") << "]\n";
        }
    }
    ss << "\n" << debug_info(address_peer_map);
    return ss.str();
}

std::string PeerDirectory::store_fingerprint_for_peer(const std::string &peer_id,
                                                      const KeyBytes    &public_key)
{
    return fingerprints_.store_fingerprint_for_peer(peer_id, public_key);
}

void PeerDirectory::update_peer_id_mapping(const std::optional<std::string> &old_peer_id,
                                           const std::string                &new_peer_id,
                                           const std::string                &fingerprint)
{
    fingerprints_.update_peer_id_mapping(old_peer_id, new_peer_id, fingerprint);
}

std::optional<std::string> PeerDirectory::fingerprint_for_peer(const std::string &peer_id) const
{
    return fingerprints_.fingerprint_for_peer(peer_id);
}

std::optional<std::string> PeerDirectory::peer_id_for_fingerprint(const std::string &fp) const
{
    return fingerprints_.peer_id_for_fingerprint(fp);
}

bool PeerDirectory::has_fingerprint_for_peer(const std::string &peer_id) const
{
    return fingerprints_.has_fingerprint_for_peer(peer_id);
}

std::map<std::string, std::string> PeerDirectory::all_peer_fingerprints() const
{
    return fingerprints_.all_peer_fingerprints();
}

void PeerDirectory::clear_all_fingerprints()
{
    fingerprints_.clear_all();
}

std::string PeerDirectory::fingerprint_debug_info() const
{
    return fingerprints_.debug_info();
}

bool PeerDirectory::remove_locked(const std::string &peer_id)
{
    const bool removed = peers_.erase(peer_id) != 0;
    rssi_.erase(peer_id);
    announced_.erase(peer_id);
    announced_to_.erase(peer_id);
    fingerprints_.remove_peer(peer_id);
    return removed;
}

bool PeerDirectory::active_locked(const PeerRecord &p, util::TimePoint now) const
{
    return now - p.last_seen <= cfg_.stale_peer_timeout && p.connected;
}

std::vector<std::string> PeerDirectory::active_ids_locked(util::TimePoint now) const
{
    std::vector<std::string> ids;
    for (const auto &kv : peers_)
    {
        if (active_locked(kv.second, now))
            ids.push_back(kv.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void PeerDirectory::notify_peer_list(const std::vector<std::string> &ids)
{
    MeshDelegate *d = delegate_.load();
    if (!d)
        return;
    try
    {
        d->on_peer_list_updated(ids);
    }
    catch (const std::exception &e)
    {
        LOG_WARN("delegate on_peer_list_updated threw: %s", e.what());
    }
    catch (...)
    {
        LOG_WARN("delegate on_peer_list_updated threw: unknown exception");
    }
}

void PeerDirectory::notify_removed(const std::string &peer_id)
{
    MeshDelegate *d = delegate_.load();
    if (!d)
        return;
    try
    {
        d->on_peer_removed(peer_id);
    }
    catch (const std::exception &e)
    {
        LOG_WARN("delegate on_peer_removed threw: %s", e.what());
    }
    catch (...)
    {
        LOG_WARN("delegate on_peer_removed threw: unknown exception");
    }
}

}  // namespace mesh

std::size_t std::hash<mesh::PeerRecord>::operator()(const mesh::PeerRecord &p) const noexcept
{
    auto mix = [](std::size_t h, std::size_t v) { return h * 31 + v; };

    auto key_hash = [](const std::optional<mesh::KeyBytes> &k) -> std::size_t {
        if (!k)
            return 0;
        std::size_t h = 17;
        for (auto b : *k)
            h = h * 31 + b;
        return h;
    };

    std::size_t h = std::hash<std::string>{}(p.id);
    h             = mix(h, std::hash<std::string>{}(p.nickname));
    h             = mix(h, p.connected);
    h             = mix(h, p.direct_connection);
    h             = mix(h, key_hash(p.noise_public_key));
    h             = mix(h, key_hash(p.signing_public_key));
    h             = mix(h, p.verified);
    h             = mix(h, std::hash<long long>{}(
                               static_cast<long long>(p.last_seen.time_since_epoch().count())));
    return h;
}
