#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crypto
{

// Fingerprint of a public key: lowercase hex SHA-256.
std::string fingerprint_of_key(const std::vector<std::uint8_t> &public_key);

// Bidirectional peer id <-> fingerprint table. One fingerprint per peer id and one peer id
// per fingerprint at all times; every mutation happens under a single lock.
class FingerprintRegistry
{
  public:
    // Binds peer_id to the key's fingerprint and returns it. Any id previously holding the
    // fingerprint loses it, as does peer_id's previous fingerprint.
    std::string store_fingerprint_for_peer(const std::string               &peer_id,
                                           const std::vector<std::uint8_t> &public_key);

    // Moves fingerprint from old_peer_id (if given) to new_peer_id.
    void update_peer_id_mapping(const std::optional<std::string> &old_peer_id,
                                const std::string                &new_peer_id,
                                const std::string                &fingerprint);

    std::optional<std::string> fingerprint_for_peer(const std::string &peer_id) const;
    std::optional<std::string> peer_id_for_fingerprint(const std::string &fingerprint) const;
    bool                       has_fingerprint_for_peer(const std::string &peer_id) const;

    // Sorted by peer id
    std::map<std::string, std::string> all_peer_fingerprints() const;

    void        remove_peer(const std::string &peer_id);
    void        clear_all();
    std::size_t size() const;
    std::string debug_info() const;

  private:
    void bind_locked(const std::string &peer_id, const std::string &fingerprint);
    void unbind_peer_locked(const std::string &peer_id);

    mutable std::mutex                           mu_;
    std::unordered_map<std::string, std::string> peer_to_fp_;
    std::unordered_map<std::string, std::string> fp_to_peer_;
};

}  // namespace crypto
