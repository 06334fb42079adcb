#include <exception>
#include <utility>

#include "mesh/fragment_manager.hpp"
#include "util/log.hpp"

namespace mesh
{

FragmentManager::FragmentManager(const util::Config &cfg, util::Clock clock)
    : cfg_(cfg),
      rx_(std::move(clock)),
      cleanup_task_("fragment-cleanup", cfg.fragment_cleanup_interval,
                    [this] { cleanup_expired(); })
{
}

bool FragmentManager::start()
{
    return cleanup_task_.start();
}

void FragmentManager::shutdown()
{
    cleanup_task_.stop();
    rx_.clear_all();
}

std::vector<proto::Packet> FragmentManager::create_fragments(const proto::Packet &packet) const
{
    return frag::make_fragments(packet, cfg_.max_fragment_size, cfg_.fragment_threshold);
}

std::optional<proto::Packet> FragmentManager::handle_incoming_fragment(const proto::Packet &packet)
{
    auto full = rx_.feed(packet);
    if (!full)
        return std::nullopt;

    if (MeshDelegate *d = delegate_.load())
    {
        try
        {
            d->on_reassembled_packet(*full);
        }
        catch (const std::exception &e)
        {
            LOG_WARN("delegate on_reassembled_packet threw: %s", e.what());
        }
        catch (...)
        {
            LOG_WARN("delegate on_reassembled_packet threw: unknown exception");
        }
    }
    return full;
}

std::size_t FragmentManager::cleanup_expired()
{
    const std::size_t n = rx_.expire(cfg_.fragment_timeout);
    if (n)
        LOG_DEBUG("Cleaned up expired fragment groups: %zu", n);
    return n;
}

}  // namespace mesh
