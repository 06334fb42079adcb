#pragma once
#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "mesh/mesh_delegate.hpp"
#include "proto/frag.hpp"
#include "proto/packet.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/periodic_task.hpp"

namespace mesh
{

// Fragmentation engine: splits oversized outbound packets and reassembles inbound
// fragment groups, expiring incomplete groups in the background.
class FragmentManager
{
  public:
    explicit FragmentManager(const util::Config &cfg,
                             util::Clock         clock = util::steady_clock_source());
    ~FragmentManager() { shutdown(); }

    FragmentManager(const FragmentManager &)            = delete;
    FragmentManager &operator=(const FragmentManager &) = delete;

    // Starts the expiry task.
    bool start();
    // Stops the expiry task and drops all partial groups.
    void shutdown();

    void set_delegate(MeshDelegate *d) { delegate_.store(d); }

    std::vector<proto::Packet> create_fragments(const proto::Packet &packet) const;

    // Returns the original packet when this fragment completes its group; the delegate's
    // on_reassembled_packet fires for that same packet exactly once.
    std::optional<proto::Packet> handle_incoming_fragment(const proto::Packet &packet);

    // One expiry pass; returns the number of groups discarded.
    std::size_t cleanup_expired();

    std::size_t pending_count() const { return rx_.pending_count(); }
    bool        has_pending(const std::string &fragment_id_hex) const
    {
        return rx_.has_pending(fragment_id_hex);
    }
    void clear_all() { rx_.clear_all(); }

  private:
    util::Config               cfg_;
    frag::Reassembler          rx_;
    std::atomic<MeshDelegate *> delegate_{nullptr};
    util::PeriodicTask         cleanup_task_;
};

}  // namespace mesh
