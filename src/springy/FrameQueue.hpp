#pragma once

#include "IFrameScheduler.hpp"

#include <cstddef>
#include <map>

namespace springy
{

/**
 * @brief IFrameScheduler backed by an explicit per-frame pump.
 *
 * The host calls runFrame() once per rendered frame. Only requests made
 * before the call run in that frame; callbacks that re-request are served
 * on the following frame. Requests run in the order they were made.
 */
class FrameQueue : public IFrameScheduler
{
public:
    FrameRequestId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameRequestId id) override;

    // Returns the number of callbacks that ran.
    std::size_t runFrame(double timestamp_ms);

    std::size_t pendingCount() const { return pending_.size(); }
    bool empty() const { return pending_.empty(); }

private:
    std::map<FrameRequestId, FrameCallback> pending_;
    std::map<FrameRequestId, FrameCallback> running_;
    FrameRequestId next_id_ = 1;
};

} // namespace springy
