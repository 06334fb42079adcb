#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
Generic mesh envelope. Only the envelope is defined here; the body of each
message type belongs to the layer that consumes it.

[ver u8][type u8][sender 8B][payload_len u16 BE][payload ...]
*/

namespace proto
{

inline constexpr std::uint8_t PACKET_VER  = 1;
inline constexpr std::size_t  SENDER_SIZE = 8;
inline constexpr std::size_t  HDR_SIZE    = 1 + 1 + SENDER_SIZE + 2;
inline constexpr std::size_t  MAX_PAYLOAD = 0xFFFF;

enum class MessageType : std::uint8_t
{
    Announce              = 0x01,
    Leave                 = 0x03,
    Message               = 0x04,
    NoiseIdentityAnnounce = 0x13,
    Fragment              = 0x20,
};

using SenderId = std::array<std::uint8_t, SENDER_SIZE>;
using Bytes    = std::vector<std::uint8_t>;

struct Packet
{
    std::uint8_t type{0};
    SenderId     sender{};
    Bytes        payload;

    Packet() = default;
    Packet(std::uint8_t t, const SenderId &s, Bytes p) : type(t), sender(s), payload(std::move(p))
    {
    }
    Packet(MessageType t, const SenderId &s, Bytes p)
        : Packet(static_cast<std::uint8_t>(t), s, std::move(p))
    {
    }

    bool is(MessageType t) const { return type == static_cast<std::uint8_t>(t); }

    // Size of encode(*this) on the wire.
    std::size_t encoded_size() const { return HDR_SIZE + payload.size(); }

    bool operator==(const Packet &o) const
    {
        return type == o.type && sender == o.sender && payload == o.payload;
    }
    bool operator!=(const Packet &o) const { return !(*this == o); }
};

// Empty result when the payload does not fit a u16 length.
Bytes                 encode(const Packet &p);
std::optional<Packet> decode(const Bytes &frame);

// Peer ids are the sender bytes as 16 lowercase hex characters.
std::string             peer_id_of(const SenderId &sender);
std::optional<SenderId> sender_from_peer_id(std::string_view peer_id);

}  // namespace proto
