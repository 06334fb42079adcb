#include <algorithm>
#include <arpa/inet.h>  // htons, ntohs
#include <cstdint>
#include <cstring>
#include <utility>

#include "crypto/sodium_util.hpp"
#include "proto/frag.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace frag
{

std::vector<std::uint8_t> FragmentPayload::encode() const
{
    std::vector<std::uint8_t> out(FRAG_HDR_SIZE + data.size());
    std::memcpy(out.data(), fragment_id.data(), FRAGMENT_ID_SIZE);

    std::uint16_t index_be = htons(fragment_index);
    std::memcpy(out.data() + 8, &index_be, sizeof index_be);

    std::uint16_t total_be = htons(total_fragments);
    std::memcpy(out.data() + 10, &total_be, sizeof total_be);

    out[12] = original_type;
    if (!data.empty())
        std::memcpy(out.data() + FRAG_HDR_SIZE, data.data(), data.size());
    return out;
}

std::optional<FragmentPayload> FragmentPayload::decode(const std::vector<std::uint8_t> &in)
{
    if (in.size() < FRAG_HDR_SIZE)
        return std::nullopt;

    FragmentPayload p;
    std::memcpy(p.fragment_id.data(), in.data(), FRAGMENT_ID_SIZE);

    std::uint16_t index_be;
    std::memcpy(&index_be, in.data() + 8, sizeof index_be);
    p.fragment_index = ntohs(index_be);

    std::uint16_t total_be;
    std::memcpy(&total_be, in.data() + 10, sizeof total_be);
    p.total_fragments = ntohs(total_be);

    p.original_type = in[12];

    // validate after parsing
    if (p.total_fragments == 0)
        return std::nullopt;
    if (p.fragment_index >= p.total_fragments)
        return std::nullopt;

    p.data.assign(in.begin() + FRAG_HDR_SIZE, in.end());
    return p;
}

std::string FragmentPayload::fragment_id_hex() const
{
    return util::to_hex(fragment_id.data(), fragment_id.size());
}

FragmentId generate_fragment_id()
{
    FragmentId id{};
    crypto::random_bytes(id.data(), id.size());
    return id;
}

std::vector<proto::Packet> make_fragments(const proto::Packet &packet,
                                          std::size_t          max_fragment_bytes,
                                          std::size_t          threshold_bytes)
{
    if (max_fragment_bytes == 0 || max_fragment_bytes >= threshold_bytes)
    {
        LOG_ERROR("make_fragments: invalid limits (max=%zu, threshold=%zu)", max_fragment_bytes,
                  threshold_bytes);
        return {};
    }

    // never fragment a fragment
    if (packet.encoded_size() <= threshold_bytes || packet.is(proto::MessageType::Fragment) ||
        packet.payload.empty())
        return {packet};

    const auto       &full       = packet.payload;
    const std::size_t num_chunks = (full.size() + max_fragment_bytes - 1) / max_fragment_bytes;
    if (num_chunks > MAX_FRAGMENTS)
    {
        LOG_ERROR("make_fragments: payload too large (%zu bytes, needs %zu fragments)",
                  full.size(), num_chunks);
        return {};
    }

    const FragmentId           id = generate_fragment_id();
    std::vector<proto::Packet> out;
    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * max_fragment_bytes;
        const std::size_t take  = std::min(max_fragment_bytes, full.size() - start);

        FragmentPayload fp;
        fp.fragment_id     = id;
        fp.fragment_index  = static_cast<std::uint16_t>(i);
        fp.total_fragments = static_cast<std::uint16_t>(num_chunks);
        fp.original_type   = packet.type;
        fp.data.assign(full.begin() + start, full.begin() + start + take);

        out.emplace_back(proto::MessageType::Fragment, packet.sender, fp.encode());
    }

    LOG_DEBUG("make_fragments: %zu fragments for %zu bytes", out.size(), full.size());
    return out;
}

Reassembler::Reassembler(util::Clock clock) : clock_(std::move(clock)) {}

std::optional<proto::Packet> Reassembler::feed(const proto::Packet &fragment_packet)
{
    if (!fragment_packet.is(proto::MessageType::Fragment))
        return std::nullopt;

    auto fp = FragmentPayload::decode(fragment_packet.payload);
    if (!fp)
    {
        LOG_DEBUG("Reassembler::feed: undecodable fragment payload (%zu bytes)",
                  fragment_packet.payload.size());
        return std::nullopt;
    }

    const std::string key = fp->fragment_id_hex();
    std::vector<std::uint8_t> out;
    proto::Packet             done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_.count(key))
        {
            LOG_DEBUG("Reassembler::feed: group %s already closed, dropping", key.c_str());
            return std::nullopt;
        }

        auto it = map_.find(key);
        if (it == map_.end())
        {
            State st;
            st.total         = fp->total_fragments;
            st.original_type = fp->original_type;
            st.sender        = fragment_packet.sender;
            st.created       = clock_();
            it               = map_.emplace(key, std::move(st)).first;
        }
        State &st = it->second;

        if (st.total != fp->total_fragments)
        {
            LOG_DEBUG("Reassembler::feed: total mismatch for %s (%u != %u), dropping",
                      key.c_str(), (unsigned)fp->total_fragments, (unsigned)st.total);
            return std::nullopt;
        }

        // same index again overwrites, never double counts
        auto &slot = st.parts[fp->fragment_index];
        st.bytes -= slot.size();
        st.bytes += fp->data.size();
        slot = std::move(fp->data);

        if (st.parts.size() < st.total)
            return std::nullopt;  // not done yet

        out.reserve(st.bytes);
        for (const auto &kv : st.parts)
            out.insert(out.end(), kv.second.begin(), kv.second.end());

        done.type   = st.original_type;
        done.sender = st.sender;
        map_.erase(it);
        closed_[key] = clock_();
    }

    done.payload = std::move(out);
    LOG_DEBUG("Reassembler::feed: reassembled %s (%zu bytes)", key.c_str(), done.payload.size());
    return done;
}

std::size_t Reassembler::expire(std::chrono::milliseconds timeout)
{
    const util::TimePoint       now    = clock_();
    const util::TimePoint       cutoff = now - timeout;
    std::lock_guard<std::mutex> lk(mu_);

    for (auto it = closed_.begin(); it != closed_.end();)
    {
        if (it->second < cutoff)
            it = closed_.erase(it);
        else
            ++it;
    }

    std::size_t n = 0;
    for (auto it = map_.begin(); it != map_.end();)
    {
        if (it->second.created < cutoff)
        {
            closed_[it->first] = now;
            it                 = map_.erase(it);
            n++;
        }
        else
        {
            ++it;
        }
    }
    return n;
}

std::size_t Reassembler::pending_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

bool Reassembler::has_pending(const std::string &fragment_id_hex) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.count(fragment_id_hex) != 0;
}

void Reassembler::clear(const std::string &fragment_id_hex)
{
    std::lock_guard<std::mutex> lk(mu_);
    map_.erase(fragment_id_hex);
}

void Reassembler::clear_all()
{
    std::lock_guard<std::mutex> lk(mu_);
    map_.clear();
    closed_.clear();
}

}  // namespace frag
