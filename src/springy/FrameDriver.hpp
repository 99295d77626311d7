#pragma once

#include "IFrameScheduler.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace springy
{

/**
 * @brief Runs a step function once per host frame until it reports completion.
 *
 * At most one driving session is active at a time: drive() while active is a
 * no-op. The first frame of a session only establishes the baseline
 * timestamp and calls the step function with 0 ms; later frames pass the
 * time since the previous frame. The session ends when the step function
 * returns false, or on cancel()/destruction, which also withdraws the
 * pending frame request. A step function that throws ends the session and
 * the exception propagates to the scheduler.
 */
class FrameDriver
{
public:
    // Returns true while more frames are needed.
    using StepFunction = std::function<bool(double elapsed_ms)>;

    FrameDriver(IFrameScheduler& scheduler, StepFunction step);
    ~FrameDriver();

    FrameDriver(const FrameDriver&) = delete;
    FrameDriver& operator=(const FrameDriver&) = delete;

    void drive();
    void cancel();

    bool isActive() const { return active_; }
    std::uint64_t sessionCount() const { return session_; }

private:
    void requestNextFrame();
    void onFrame(std::uint64_t session, double timestamp_ms);
    void finishSession(const char* reason);

    IFrameScheduler& scheduler_;
    StepFunction step_;

    bool active_ = false;
    std::uint64_t session_ = 0;
    std::optional<FrameRequestId> pending_request_;
    std::optional<double> last_timestamp_ms_;

    // per-session bookkeeping for logs
    std::uint64_t frames_ = 0;
    double simulated_ms_ = 0.0;
};

} // namespace springy
