#include <arpa/inet.h>  // htons, ntohs
#include <cstring>

#include "proto/packet.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace proto
{

Bytes encode(const Packet &p)
{
    if (p.payload.size() > MAX_PAYLOAD)
    {
        LOG_ERROR("encode: payload too large (%zu bytes)", p.payload.size());
        return {};
    }

    Bytes out(HDR_SIZE + p.payload.size());
    out[0] = PACKET_VER;
    out[1] = p.type;
    std::memcpy(out.data() + 2, p.sender.data(), SENDER_SIZE);

    std::uint16_t len_be = htons(static_cast<std::uint16_t>(p.payload.size()));
    std::memcpy(out.data() + 2 + SENDER_SIZE, &len_be, sizeof len_be);

    if (!p.payload.empty())
        std::memcpy(out.data() + HDR_SIZE, p.payload.data(), p.payload.size());
    return out;
}

std::optional<Packet> decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE)
    {
        LOG_DEBUG("decode: frame too short (%zu)", frame.size());
        return std::nullopt;
    }
    if (frame[0] != PACKET_VER)
    {
        LOG_DEBUG("decode: unsupported version %u", (unsigned)frame[0]);
        return std::nullopt;
    }

    std::uint16_t len_be;
    std::memcpy(&len_be, frame.data() + 2 + SENDER_SIZE, sizeof len_be);
    const std::size_t len = ntohs(len_be);
    if (frame.size() != HDR_SIZE + len)
    {
        LOG_DEBUG("decode: size mismatch (got %zu, expect %zu)", frame.size(), HDR_SIZE + len);
        return std::nullopt;
    }

    Packet p;
    p.type = frame[1];
    std::memcpy(p.sender.data(), frame.data() + 2, SENDER_SIZE);
    p.payload.assign(frame.begin() + HDR_SIZE, frame.end());
    return p;
}

std::string peer_id_of(const SenderId &sender)
{
    return util::to_hex(sender.data(), sender.size());
}

std::optional<SenderId> sender_from_peer_id(std::string_view peer_id)
{
    auto bytes = util::from_hex(peer_id);
    if (!bytes || bytes->size() != SENDER_SIZE)
        return std::nullopt;
    SenderId s{};
    std::memcpy(s.data(), bytes->data(), SENDER_SIZE);
    return s;
}

}  // namespace proto
