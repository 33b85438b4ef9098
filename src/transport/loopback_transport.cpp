#include <utility>

#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: the display and the camera are the same process. Every
// presented code is "captured" right away, except the ones a simulated camera
// misses.
bool LoopbackTransport::start(const Settings &s, OnCode on_capture)
{
    std::lock_guard<std::mutex> lock(mu_);
    on_capture_ = std::move(on_capture);
    max_len_    = s.max_code_len;
    drop_every_ = s.drop_every;
    presented_  = 0;
    dropped_    = 0;
    started_    = true;
    return true;
}

bool LoopbackTransport::present(const Code &one_code)
{
    OnCode cb;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!started_ || !on_capture_)
            return false;
        if (max_len_ != 0 && one_code.size() > max_len_)
            return false;
        presented_++;
        if (drop_every_ != 0 && presented_ % drop_every_ == 0)
        {
            dropped_++;
            LOG_DEBUG("LoopbackTransport: camera missed code #%zu", presented_);
            return true;  // shown, just not captured
        }
        cb = on_capture_;
    }
    cb(one_code);
    return true;
}

void LoopbackTransport::stop()
{
    std::lock_guard<std::mutex> lock(mu_);
    started_    = false;
    on_capture_ = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return started_;
}

std::size_t LoopbackTransport::presented() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return presented_;
}

std::size_t LoopbackTransport::dropped() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
}

}  // namespace transport
