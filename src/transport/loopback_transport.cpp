#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{

bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_rx_   = std::move(on_rx);
    mtu_     = s.mtu_payload;
    started_ = true;
    return true;
}

bool LoopbackTransport::send(const Frame &frame)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return false;
        if (mtu_ != 0 && frame.size() > mtu_)
        {
            LOG_WARN("LoopbackTransport::send: frame exceeds mtu (%zu > %zu)", frame.size(), mtu_);
            return false;
        }
        frames_sent_++;
    }
    LoopbackTransport *target = peer_ ? peer_ : this;
    target->deliver(frame, address_);
    return true;
}

void LoopbackTransport::deliver(const Frame &frame, const std::string &from)
{
    OnFrame cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_ || !on_rx_)
            return;
        cb = on_rx_;
    }
    // outside the lock so the receiver may send in response
    cb(frame, from);
}

void LoopbackTransport::stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_ = false;
    on_rx_   = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return started_;
}

}  // namespace transport
