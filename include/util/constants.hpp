#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace constants
{
// Fragmentation contract; both ends of a link must agree on these two values.
inline constexpr std::size_t FRAGMENT_SIZE_THRESHOLD = 512;
inline constexpr std::size_t MAX_FRAGMENT_SIZE       = 469;

inline constexpr std::chrono::milliseconds FRAGMENT_TIMEOUT{30'000};
inline constexpr std::chrono::milliseconds FRAGMENT_CLEANUP_INTERVAL{10'000};

// Peer liveness (3 minutes, same as the iOS client)
inline constexpr std::chrono::milliseconds STALE_PEER_TIMEOUT{180'000};
inline constexpr std::chrono::milliseconds PEER_CLEANUP_INTERVAL{60'000};
// Same-nickname records seen more recently than this are kept on collision
inline constexpr std::chrono::milliseconds RECENTLY_SEEN_WINDOW{10'000};

inline constexpr std::string_view UNKNOWN_PEER_ID = "unknown";

}  // namespace constants
