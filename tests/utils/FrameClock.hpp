#pragma once

#include "springy/FrameQueue.hpp"

#include <cstddef>

namespace test_utils
{

// Pumps a FrameQueue with a fake monotonic clock.
class FrameClock
{
public:
    explicit FrameClock(springy::FrameQueue& frames, double start_ms = 1000.0)
        : frames_(frames)
        , now_ms_(start_ms)
    {
    }

    // Runs one frame, frame_ms after the previous one.
    std::size_t advance(double frame_ms = 16.0)
    {
        now_ms_ += frame_ms;
        return frames_.runFrame(now_ms_);
    }

    // Runs frames until nothing is requested or limit_ms has passed.
    // Returns the time that passed.
    double runUntilIdle(double limit_ms, double frame_ms = 16.0)
    {
        const double start = now_ms_;
        while (!frames_.empty() && now_ms_ - start < limit_ms)
            advance(frame_ms);
        return now_ms_ - start;
    }

    double now() const { return now_ms_; }

private:
    springy::FrameQueue& frames_;
    double now_ms_;
};

} // namespace test_utils
