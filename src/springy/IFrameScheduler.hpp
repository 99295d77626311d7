#pragma once

#include <cstdint>
#include <functional>

namespace springy
{

using FrameRequestId = std::uint64_t;

// Receives the host's frame timestamp in milliseconds.
using FrameCallback = std::function<void(double timestamp_ms)>;

/**
 * @brief Host service that runs a callback once on its next frame.
 *
 * Each request fires at most once; callers re-request to keep receiving
 * frames. Timestamps are monotonic milliseconds on the host's clock.
 */
class IFrameScheduler
{
public:
    virtual ~IFrameScheduler() = default;

    /**
     * @brief Schedule a callback for the next frame.
     * @return Id usable with cancelFrame() until the callback has run
     */
    virtual FrameRequestId requestFrame(FrameCallback callback) = 0;

    /**
     * @brief Withdraw a pending request. Unknown or already-run ids are ignored.
     */
    virtual void cancelFrame(FrameRequestId id) = 0;
};

} // namespace springy
