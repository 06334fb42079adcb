#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "util/constants.hpp"

namespace util
{

struct Config
{
    std::size_t               fragment_threshold        = constants::FRAGMENT_SIZE_THRESHOLD;
    std::size_t               max_fragment_size         = constants::MAX_FRAGMENT_SIZE;
    std::chrono::milliseconds fragment_timeout          = constants::FRAGMENT_TIMEOUT;
    std::chrono::milliseconds fragment_cleanup_interval = constants::FRAGMENT_CLEANUP_INTERVAL;
    std::chrono::milliseconds stale_peer_timeout        = constants::STALE_PEER_TIMEOUT;
    std::chrono::milliseconds peer_cleanup_interval     = constants::PEER_CLEANUP_INTERVAL;
    std::chrono::milliseconds recently_seen_window      = constants::RECENTLY_SEEN_WINDOW;

    // max_fragment_size must leave room for framing below the threshold
    bool valid() const;

    // Defaults overridden by DOGEMESH_* environment variables. Unparsable values are
    // ignored with a warning; an inconsistent fragment pair reverts both to defaults.
    static Config from_env();
};

// Returns defv when the variable is unset or empty.
std::string env_or(const char *key, const char *defv);

}  // namespace util
