#include "Spring.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <sstream>
#include <utility>

namespace springy
{

namespace
{

class ResetScope
{
public:
    explicit ResetScope(bool& flag)
        : flag_(flag)
    {
        flag_ = true;
    }
    ~ResetScope() { flag_ = false; }

    ResetScope(const ResetScope&) = delete;
    ResetScope& operator=(const ResetScope&) = delete;

private:
    bool& flag_;
};

} // namespace

Spring::Spring(IFrameScheduler& scheduler, Observable<SpringOptions>& options)
    : Spring(scheduler, options.get())
{
    options_sub_ = options.subscribe([this](const SpringOptions& updated) { applyOptions(updated); });
}

Spring::Spring(IFrameScheduler& scheduler, const SpringOptions& options)
    : value_(options.startValue())
    , velocity_(options.startVelocity())
    , target_(options.target())
    , duration_(options.effectiveDuration())
    , damping_ratio_(options.effectiveDampingRatio())
    , driver_(scheduler, [this](double elapsed_ms) { return tick(elapsed_ms); })
    , option_target_(options.target())
{
    recomputeConstants();
    connect();

    if (!atRest())
        driver_.drive();
}

Spring::~Spring() = default;

void Spring::connect()
{
    target_sub_ = target_.subscribe([this](const double&) { onTargetChanged(); });
    duration_sub_ = duration_.subscribe([this](const double&) { recomputeConstants(); });
    damping_sub_ = damping_ratio_.subscribe([this](const double&) { recomputeConstants(); });
}

void Spring::set(double target, SetOptions options)
{
    notifier_.registerCallback(target, std::move(options.on_complete));
    target_.set(target);
}

void Spring::reset(double value, double velocity)
{
    {
        ResetScope scope(resetting_);
        value_.set(value);
        velocity_.set(velocity);
        target_.set(value);
    }

    if (velocity != 0.0 && !driver_.isActive())
        driver_.drive();
}

void Spring::stop() { driver_.cancel(); }

void Spring::applyOptions(const SpringOptions& options)
{
    duration_.set(options.effectiveDuration());
    damping_ratio_.set(options.effectiveDampingRatio());

    // Only a change of the configured value re-targets; set() targets survive
    // unrelated option edits.
    const double configured = options.target();
    if (!option_target_ || *option_target_ != configured)
    {
        option_target_ = configured;
        target_.set(configured);
    }
}

void Spring::recomputeConstants()
{
    const double duration = duration_.get();
    const double ratio = damping_ratio_.get();
    constants_ = deriveConstants(duration, ratio);

    PLOG_DEBUG << "Spring constants: k=" << constants_.stiffness << " c=" << constants_.damping
               << " (duration=" << duration << ", damping_ratio=" << ratio << ")";

    if (!parametersWellFormed(duration, ratio))
    {
        std::ostringstream details;
        details << "duration=" << duration << " damping_ratio=" << ratio << " k=" << constants_.stiffness
                << " c=" << constants_.damping;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Spring parameters are out of range; the animation may never settle",
                                            details.str());
    }
}

void Spring::onTargetChanged()
{
    if (resetting_)
        return;
    driver_.drive();
}

bool Spring::tick(double elapsed_ms)
{
    SpringState state{ value_.get(), velocity_.get(), target_.get() };
    const StepResult result = integrator_.step(state, constants_, elapsed_ms);

    velocity_.set(state.velocity);
    value_.set(state.value);

    if (result == StepResult::Moving)
        return true;

    notifier_.notifySettled(state.target);

    // The completion callback may have sent the spring somewhere else.
    return !atRest();
}

bool Spring::atRest() const { return value_.get() == target_.get() && velocity_.get() == 0.0; }

} // namespace springy
