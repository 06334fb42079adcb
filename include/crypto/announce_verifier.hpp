#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace crypto
{

inline constexpr std::size_t SIGNING_KEY_SIZE = 32;  // crypto_sign_PUBLICKEYBYTES
inline constexpr std::size_t SIGNATURE_SIZE   = 64;  // crypto_sign_BYTES
inline constexpr std::size_t NOISE_KEY_SIZE   = 32;  // X25519 static key

// Checks that an identity announcement was signed by the announced signing key.
class AnnounceVerifier
{
  public:
    virtual ~AnnounceVerifier() = default;

    virtual bool verify(const std::vector<std::uint8_t> &signed_data,
                        const std::vector<std::uint8_t> &signature,
                        const std::vector<std::uint8_t> &signing_public_key) = 0;
};

// Fixed answer, for wiring tests that do not exercise signatures.
class NoopAnnounceVerifier : public AnnounceVerifier
{
  public:
    explicit NoopAnnounceVerifier(bool accept = true) : accept_(accept) {}

    bool verify(const std::vector<std::uint8_t> & /*signed_data*/,
                const std::vector<std::uint8_t> & /*signature*/,
                const std::vector<std::uint8_t> & /*signing_public_key*/) override
    {
        return accept_;
    }

  private:
    bool accept_;
};

// libsodium Ed25519 detached signature check
class SodiumAnnounceVerifier : public AnnounceVerifier
{
  public:
    bool verify(const std::vector<std::uint8_t> &signed_data,
                const std::vector<std::uint8_t> &signature,
                const std::vector<std::uint8_t> &signing_public_key) override;
};

}  // namespace crypto
