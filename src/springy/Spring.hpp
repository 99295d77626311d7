#pragma once

#include "CompletionNotifier.hpp"
#include "FrameDriver.hpp"
#include "IFrameScheduler.hpp"
#include "Observable.hpp"
#include "SpringIntegrator.hpp"
#include "SpringOptions.hpp"
#include "SpringParameters.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace springy
{

/**
 * @brief A scalar animated toward a movable target by a damped spring.
 *
 * The spring is Idle while it rests on its target and Animating while a
 * driving session steps it once per host frame. Changing the target (via
 * set() or the live options) starts a session when Idle; an active session
 * simply picks up the new target on its next frame.
 *
 * The scheduler must outlive the spring. Destroying the spring cancels its
 * pending frame request.
 *
 * Usage:
 *   FrameQueue frames;
 *   Spring spring(frames, SpringOptions{ .duration = 0.5, .damping_ratio = 0.7 });
 *   spring.set(1.0, { .on_complete = [] { PLOG_INFO << "done"; } });
 *   // host loop: frames.runFrame(now_ms); draw(spring.value());
 */
class Spring
{
public:
    struct SetOptions
    {
        // Runs once when the spring settles at exactly this target. Anything
        // it throws is reported under ErrorCategory::Callback.
        std::function<void()> on_complete;
    };

    // Follows live options: a changed value re-targets, changed
    // duration/damping_ratio apply from the next frame.
    Spring(IFrameScheduler& scheduler, Observable<SpringOptions>& options);
    explicit Spring(IFrameScheduler& scheduler, const SpringOptions& options = {});
    ~Spring();

    Spring(const Spring&) = delete;
    Spring& operator=(const Spring&) = delete;

    void set(double target, SetOptions options = {});

    // Teleports to value, which also becomes the target. A nonzero velocity
    // starts a session so the spring swings away and back.
    void reset(double value, double velocity = 0.0);

    // Ends the current session; value and velocity stay where they are.
    void stop();

    double value() const { return value_.get(); }
    double velocity() const { return velocity_.get(); }
    double target() const { return target_.get(); }
    double duration() const { return duration_.get(); }
    double dampingRatio() const { return damping_ratio_.get(); }
    const SpringConstants& constants() const { return constants_; }

    bool isAnimating() const { return driver_.isActive(); }
    std::size_t pendingCompletions() const { return notifier_.pendingCount(); }

    Observable<double>& valueCell() { return value_; }

private:
    void connect();
    void applyOptions(const SpringOptions& options);
    void recomputeConstants();
    void onTargetChanged();
    bool tick(double elapsed_ms);
    bool atRest() const;

    Observable<double> value_;
    Observable<double> velocity_;
    Observable<double> target_;
    Observable<double> duration_;
    Observable<double> damping_ratio_;

    SpringConstants constants_;
    CompletionNotifier notifier_;
    SpringIntegrator integrator_;
    FrameDriver driver_;

    std::optional<double> option_target_;
    bool resetting_ = false;

    Observable<double>::Subscription target_sub_;
    Observable<double>::Subscription duration_sub_;
    Observable<double>::Subscription damping_sub_;
    Observable<SpringOptions>::Subscription options_sub_;
};

} // namespace springy
