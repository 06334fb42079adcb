#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Frame = std::vector<std::uint8_t>;
// address identifies the link the frame arrived on (BLE MAC, "loopback", ...)
using OnFrame = std::function<void(const Frame &frame, const std::string &address)>;

struct Settings
{
    std::string role;  // "central" / "peripheral" for radio links, "loopback" for tests
    // Largest frame a single write may carry; 0 disables the check.
    std::size_t mtu_payload = constants::FRAGMENT_SIZE_THRESHOLD;
};

struct ITransport
{
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual bool        send(const Frame &frame)                = 0;  // one encoded packet
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
