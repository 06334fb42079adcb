#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto/fingerprint_registry.hpp"
#include "mesh/mesh_delegate.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/periodic_task.hpp"

namespace mesh
{

using KeyBytes = std::vector<std::uint8_t>;

struct PeerRecord
{
    std::string             id;
    std::string             nickname;
    bool                    connected{false};
    bool                    direct_connection{false};
    std::optional<KeyBytes> noise_public_key;
    std::optional<KeyBytes> signing_public_key;
    bool                    verified{false};
    util::TimePoint         last_seen{};

    bool operator==(const PeerRecord &o) const
    {
        return id == o.id && nickname == o.nickname && connected == o.connected &&
               direct_connection == o.direct_connection &&
               noise_public_key == o.noise_public_key &&
               signing_public_key == o.signing_public_key && verified == o.verified &&
               last_seen == o.last_seen;
    }
    bool operator!=(const PeerRecord &o) const { return !(*this == o); }
};

/*
Per peer id:
  unknown --add_or_update_peer--> announced-unverified
  unknown | announced-unverified --update_peer_info(verified)--> announced-verified
  announced-* --remove_peer / stale cleanup--> removed (record and side tables gone)

Verification never goes back to false for a live record.
*/
class PeerDirectory
{
  public:
    // transport address -> peer id, only used to annotate debug dumps
    using AddressPeerMap = std::map<std::string, std::string>;

    PeerDirectory(crypto::FingerprintRegistry &fingerprints,
                  const util::Config          &cfg,
                  util::Clock                  clock = util::steady_clock_source());
    ~PeerDirectory() { shutdown(); }

    PeerDirectory(const PeerDirectory &)            = delete;
    PeerDirectory &operator=(const PeerDirectory &) = delete;

    // Starts the stale-peer cleanup task.
    bool start();
    // Stops the cleanup task and clears every table; no notifications are sent.
    void shutdown();

    void set_delegate(MeshDelegate *d) { delegate_.store(d); }

    // Announcement carrying key material. Returns true the first time this id becomes
    // verified, which is also when the peer list update fires.
    bool update_peer_info(const std::string &peer_id,
                          const std::string &nickname,
                          const KeyBytes    &noise_public_key,
                          const KeyBytes    &signing_public_key,
                          bool               verified);

    // Plain announcement. Drops other ids with the same nickname that were not seen within
    // the recently-seen window, then creates or refreshes the record. True on first announce.
    bool add_or_update_peer(const std::string &peer_id, const std::string &nickname);

    void set_direct_connection(const std::string &peer_id, bool direct);
    void update_peer_last_seen(const std::string &peer_id);
    void update_peer_rssi(const std::string &peer_id, int rssi);
    void mark_peer_announced_to(const std::string &peer_id);

    // No-op for unknown ids.
    void remove_peer(const std::string &peer_id, bool notify = true);
    void clear_all_peers();

    // Removes peers not seen within the stale timeout; returns how many were removed.
    std::size_t cleanup_stale_peers();

    std::optional<PeerRecord>         peer_info(const std::string &peer_id) const;
    bool                              is_peer_verified(const std::string &peer_id) const;
    std::map<std::string, PeerRecord> verified_peers() const;
    bool                              is_peer_active(const std::string &peer_id) const;
    std::vector<std::string>          active_peer_ids() const;  // sorted
    std::size_t                       active_peer_count() const;
    bool                              has_announced_to_peer(const std::string &peer_id) const;
    std::optional<int>                peer_rssi(const std::string &peer_id) const;
    std::map<std::string, int>        all_peer_rssi() const;
    std::optional<std::string>        peer_nickname(const std::string &peer_id) const;
    std::map<std::string, std::string> all_peer_nicknames() const;
    std::size_t                       size() const;

    std::string debug_info(const AddressPeerMap &address_peer_map = {}) const;
    std::string debug_info_with_device_addresses(const AddressPeerMap &address_peer_map) const;

    // Fingerprints live in the registry; these forward to it.
    std::string store_fingerprint_for_peer(const std::string &peer_id, const KeyBytes &public_key);
    void        update_peer_id_mapping(const std::optional<std::string> &old_peer_id,
                                       const std::string                &new_peer_id,
                                       const std::string                &fingerprint);
    std::optional<std::string>         fingerprint_for_peer(const std::string &peer_id) const;
    std::optional<std::string>         peer_id_for_fingerprint(const std::string &fp) const;
    bool                               has_fingerprint_for_peer(const std::string &peer_id) const;
    std::map<std::string, std::string> all_peer_fingerprints() const;
    void                               clear_all_fingerprints();
    std::string                        fingerprint_debug_info() const;

  private:
    bool                     remove_locked(const std::string &peer_id);
    bool                     active_locked(const PeerRecord &p, util::TimePoint now) const;
    std::vector<std::string> active_ids_locked(util::TimePoint now) const;

    void notify_peer_list(const std::vector<std::string> &ids);
    void notify_removed(const std::string &peer_id);

    crypto::FingerprintRegistry &fingerprints_;
    util::Config                 cfg_;
    util::Clock                  clock_;

    mutable std::mutex                          mu_;
    std::unordered_map<std::string, PeerRecord> peers_;
    std::unordered_map<std::string, int>        rssi_;
    std::set<std::string>                       announced_;
    std::set<std::string>                       announced_to_;

    std::atomic<MeshDelegate *> delegate_{nullptr};
    util::PeriodicTask          cleanup_task_;
};

}  // namespace mesh

namespace std
{
template <>
struct hash<mesh::PeerRecord>
{
    std::size_t operator()(const mesh::PeerRecord &p) const noexcept;
};
}  // namespace std
