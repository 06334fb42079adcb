#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>

#include "transport/itransport.hpp"

namespace transport
{

// In-process link: every sent frame is delivered straight back to on_rx, or to a paired
// peer transport when connect() was used.
class LoopbackTransport final : public ITransport
{
  public:
    explicit LoopbackTransport(std::string address = "loopback") : address_(std::move(address)) {}

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &frame) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

    // Route this transport's frames to other instead of itself (one direction).
    void connect(LoopbackTransport *other) { peer_ = other; }

    std::size_t frames_sent() const { return frames_sent_; }

  private:
    void deliver(const Frame &frame, const std::string &from);

    std::string        address_;
    OnFrame            on_rx_{};
    std::size_t        mtu_{0};
    bool               started_{false};
    LoopbackTransport *peer_{nullptr};
    std::size_t        frames_sent_{0};
    mutable std::mutex mu_;
};

}  // namespace transport
