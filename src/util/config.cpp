#include <cerrno>
#include <cstdlib>
#include <optional>

#include "util/config.hpp"
#include "util/log.hpp"

namespace util
{

static std::optional<unsigned long> read_ulong(const char *key)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return std::nullopt;

    char *p = nullptr;
    errno   = 0;
    const unsigned long v = std::strtoul(e, &p, 10);
    if (errno != 0 || !p || *p != '\0' || e[0] == '-')
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect unsigned integer)", key, e);
        return std::nullopt;
    }
    return v;
}

static void read_size(const char *key, std::size_t &out)
{
    if (auto v = read_ulong(key))
    {
        if (*v == 0)
        {
            LOG_WARN("Ignoring %s=0", key);
            return;
        }
        out = static_cast<std::size_t>(*v);
    }
}

static void read_millis(const char *key, std::chrono::milliseconds &out)
{
    if (auto v = read_ulong(key))
    {
        if (*v == 0)
        {
            LOG_WARN("Ignoring %s=0", key);
            return;
        }
        out = std::chrono::milliseconds(static_cast<long long>(*v));
    }
}

bool Config::valid() const
{
    return max_fragment_size > 0 && max_fragment_size < fragment_threshold;
}

Config Config::from_env()
{
    Config c;
    read_size("DOGEMESH_FRAG_THRESHOLD", c.fragment_threshold);
    read_size("DOGEMESH_MAX_FRAGMENT", c.max_fragment_size);
    read_millis("DOGEMESH_FRAG_TIMEOUT_MS", c.fragment_timeout);
    read_millis("DOGEMESH_FRAG_CLEANUP_MS", c.fragment_cleanup_interval);
    read_millis("DOGEMESH_STALE_TIMEOUT_MS", c.stale_peer_timeout);
    read_millis("DOGEMESH_PEER_CLEANUP_MS", c.peer_cleanup_interval);
    read_millis("DOGEMESH_RECENT_WINDOW_MS", c.recently_seen_window);

    if (!c.valid())
    {
        LOG_WARN("max fragment %zu must be below threshold %zu; using defaults %zu/%zu",
                 c.max_fragment_size, c.fragment_threshold, constants::MAX_FRAGMENT_SIZE,
                 constants::FRAGMENT_SIZE_THRESHOLD);
        c.fragment_threshold = constants::FRAGMENT_SIZE_THRESHOLD;
        c.max_fragment_size  = constants::MAX_FRAGMENT_SIZE;
    }
    return c;
}

std::string env_or(const char *key, const char *defv)
{
    const char *v = std::getenv(key);
    return (v && *v) ? std::string(v) : std::string(defv);
}

}  // namespace util
