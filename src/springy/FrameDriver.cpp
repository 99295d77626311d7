#include "FrameDriver.hpp"

#include <plog/Log.h>

#include <utility>

namespace springy
{

FrameDriver::FrameDriver(IFrameScheduler& scheduler, StepFunction step)
    : scheduler_(scheduler)
    , step_(std::move(step))
{
}

FrameDriver::~FrameDriver() { cancel(); }

void FrameDriver::drive()
{
    if (active_)
        return;

    active_ = true;
    ++session_;
    last_timestamp_ms_.reset();
    frames_ = 0;
    simulated_ms_ = 0.0;

    PLOG_DEBUG << "Driving session " << session_ << " started";
    requestNextFrame();
}

void FrameDriver::cancel()
{
    if (!active_)
        return;

    if (pending_request_)
    {
        scheduler_.cancelFrame(*pending_request_);
        pending_request_.reset();
    }
    finishSession("cancelled");
}

void FrameDriver::requestNextFrame()
{
    const std::uint64_t session = session_;
    pending_request_ = scheduler_.requestFrame([this, session](double timestamp_ms) {
        onFrame(session, timestamp_ms);
    });
}

void FrameDriver::onFrame(std::uint64_t session, double timestamp_ms)
{
    if (!active_ || session != session_)
        return;

    pending_request_.reset();

    const double elapsed_ms = last_timestamp_ms_ ? timestamp_ms - *last_timestamp_ms_ : 0.0;
    last_timestamp_ms_ = timestamp_ms;
    ++frames_;
    if (elapsed_ms > 0.0)
        simulated_ms_ += elapsed_ms;

    bool more = false;
    try
    {
        more = step_(elapsed_ms);
    }
    catch (...)
    {
        // Nothing will request another frame, so drop back to idle.
        if (active_ && session == session_)
            finishSession("failed");
        throw;
    }

    // The step may have cancelled this session or started a new one.
    if (!active_ || session != session_)
        return;

    if (more)
        requestNextFrame();
    else
        finishSession("settled");
}

void FrameDriver::finishSession(const char* reason)
{
    active_ = false;
    PLOG_DEBUG << "Driving session " << session_ << " " << reason << " after " << frames_ << " frame(s), "
               << simulated_ms_ << " ms";
}

} // namespace springy
