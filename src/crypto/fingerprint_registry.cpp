#include <sodium.h>
#include <sstream>

#include "crypto/fingerprint_registry.hpp"
#include "crypto/sodium_util.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace crypto
{

std::string fingerprint_of_key(const std::vector<std::uint8_t> &public_key)
{
    ensure_sodium_init();
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, public_key.data(), public_key.size());
    return util::to_hex(digest, sizeof digest);
}

std::string FingerprintRegistry::store_fingerprint_for_peer(const std::string &peer_id,
                                                            const std::vector<std::uint8_t> &public_key)
{
    const std::string fp = fingerprint_of_key(public_key);

    std::lock_guard<std::mutex> lk(mu_);
    bind_locked(peer_id, fp);
    LOG_DEBUG("Stored fingerprint %.16s... for peer %s", fp.c_str(), peer_id.c_str());
    return fp;
}

void FingerprintRegistry::update_peer_id_mapping(const std::optional<std::string> &old_peer_id,
                                                 const std::string                &new_peer_id,
                                                 const std::string                &fingerprint)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (old_peer_id && *old_peer_id != new_peer_id)
        unbind_peer_locked(*old_peer_id);
    bind_locked(new_peer_id, fingerprint);
    LOG_DEBUG("Remapped fingerprint %.16s... %s -> %s", fingerprint.c_str(),
              old_peer_id ? old_peer_id->c_str() : "(none)", new_peer_id.c_str());
}

std::optional<std::string> FingerprintRegistry::fingerprint_for_peer(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = peer_to_fp_.find(peer_id);
    if (it == peer_to_fp_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> FingerprintRegistry::peer_id_for_fingerprint(
    const std::string &fingerprint) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = fp_to_peer_.find(fingerprint);
    if (it == fp_to_peer_.end())
        return std::nullopt;
    return it->second;
}

bool FingerprintRegistry::has_fingerprint_for_peer(const std::string &peer_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peer_to_fp_.count(peer_id) != 0;
}

std::map<std::string, std::string> FingerprintRegistry::all_peer_fingerprints() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return {peer_to_fp_.begin(), peer_to_fp_.end()};
}

void FingerprintRegistry::remove_peer(const std::string &peer_id)
{
    std::lock_guard<std::mutex> lk(mu_);
    unbind_peer_locked(peer_id);
}

void FingerprintRegistry::clear_all()
{
    std::lock_guard<std::mutex> lk(mu_);
    peer_to_fp_.clear();
    fp_to_peer_.clear();
}

std::size_t FingerprintRegistry::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peer_to_fp_.size();
}

std::string FingerprintRegistry::debug_info() const
{
    const auto         all = all_peer_fingerprints();
    std::ostringstream ss;
    ss << "=== Fingerprint Registry ===\n";
    ss << "Mappings: " << all.size() << "\n";
    for (const auto &kv : all)
        ss << "  - " << kv.first << " -> " << kv.second.substr(0, 16) << "...\n";
    return ss.str();
}

void FingerprintRegistry::bind_locked(const std::string &peer_id, const std::string &fingerprint)
{
    // fingerprint may only belong to one id
    auto holder = fp_to_peer_.find(fingerprint);
    if (holder != fp_to_peer_.end() && holder->second != peer_id)
        peer_to_fp_.erase(holder->second);

    unbind_peer_locked(peer_id);
    peer_to_fp_[peer_id]     = fingerprint;
    fp_to_peer_[fingerprint] = peer_id;
}

void FingerprintRegistry::unbind_peer_locked(const std::string &peer_id)
{
    auto it = peer_to_fp_.find(peer_id);
    if (it == peer_to_fp_.end())
        return;
    auto back = fp_to_peer_.find(it->second);
    if (back != fp_to_peer_.end() && back->second == peer_id)
        fp_to_peer_.erase(back);
    peer_to_fp_.erase(it);
}

}  // namespace crypto
