#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "proto/packet.hpp"
#include "util/clock.hpp"

/*
TX:
packet (encoded_size > threshold, type != FRAGMENT)
  -> make_fragments(packet, max_fragment, threshold)
     -> for each chunk: Packet{FRAGMENT, sender, FragmentPayload{id, i, n, type, chunk}.encode()}
        -> transport.send(proto::encode(fragment))

RX:
transport.on_rx(frame) -> proto::decode(frame)
  -> type == FRAGMENT ? reassembler.feed(packet)
        -> complete ? Packet{original_type, sender, concat(chunks)} -> app
*/

namespace frag
{

inline constexpr std::size_t FRAGMENT_ID_SIZE = 8;
// [id 8B][index u16 BE][total u16 BE][original_type u8]
inline constexpr std::size_t FRAG_HDR_SIZE = FRAGMENT_ID_SIZE + 2 + 2 + 1;
inline constexpr std::size_t MAX_FRAGMENTS = 0xFFFF;

using FragmentId = std::array<std::uint8_t, FRAGMENT_ID_SIZE>;

struct FragmentPayload
{
    FragmentId                fragment_id{};
    std::uint16_t             fragment_index{0};
    std::uint16_t             total_fragments{0};
    std::uint8_t              original_type{0};
    std::vector<std::uint8_t> data;

    std::vector<std::uint8_t>             encode() const;
    static std::optional<FragmentPayload> decode(const std::vector<std::uint8_t> &in);

    // Reassembly group key
    std::string fragment_id_hex() const;
};

FragmentId generate_fragment_id();

// Returns {packet} when no fragmentation is needed, the fragment sequence otherwise,
// and an empty vector when the limits are unusable.
std::vector<proto::Packet> make_fragments(const proto::Packet &packet,
                                          std::size_t          max_fragment_bytes,
                                          std::size_t          threshold_bytes);

class Reassembler
{
  public:
    explicit Reassembler(util::Clock clock = util::steady_clock_source());

    // Feed one FRAGMENT packet, return the original packet once its group is complete.
    // Safe to call from several threads; a group completes at most once. Fragments of a
    // group that already completed or expired are dropped.
    std::optional<proto::Packet> feed(const proto::Packet &fragment_packet);

    // Drops groups created more than timeout ago; returns how many were dropped.
    // Closed ids older than timeout are forgotten in the same pass.
    std::size_t expire(std::chrono::milliseconds timeout);

    std::size_t pending_count() const;
    bool        has_pending(const std::string &fragment_id_hex) const;
    void        clear(const std::string &fragment_id_hex);
    void        clear_all();

  private:
    struct State
    {
        std::uint16_t                                        total         = 0;
        std::uint8_t                                         original_type = 0;
        proto::SenderId                                      sender{};
        util::TimePoint                                      created{};
        std::size_t                                          bytes = 0;
        std::map<std::uint16_t, std::vector<std::uint8_t>> parts;  // ordered by index
    };

    util::Clock                                      clock_;
    mutable std::mutex                               mu_;
    std::unordered_map<std::string, State>           map_;
    std::unordered_map<std::string, util::TimePoint> closed_;  // id -> completed/expired at
};

}  // namespace frag
