#include "SpringIntegrator.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cmath>
#include <sstream>

namespace springy
{

namespace
{

// One hour of simulated motion; anything beyond that is a stalled host clock.
constexpr std::int64_t kMaxSubSteps = 3600 * 1000;

} // namespace

bool SpringIntegrator::isSettled(const SpringState& state)
{
    return std::fabs(state.velocity) < kSettleEpsilon && std::fabs(state.value - state.target) < kSettleEpsilon;
}

std::int64_t SpringIntegrator::subStepCount(double elapsed_ms)
{
    if (!std::isfinite(elapsed_ms) || elapsed_ms <= 0.0)
        return 0;

    const double steps = std::floor(elapsed_ms / kStepMillis);
    if (steps >= static_cast<double>(kMaxSubSteps))
    {
        PLOG_WARNING << "Frame of " << elapsed_ms << " ms clamped to " << kMaxSubSteps << " sub-steps";
        return kMaxSubSteps;
    }
    return static_cast<std::int64_t>(steps);
}

StepResult SpringIntegrator::step(SpringState& state, const SpringConstants& constants, double elapsed_ms)
{
    if (isSettled(state))
    {
        state.value = state.target;
        state.velocity = 0.0;
        reported_non_finite_ = false;
        return StepResult::Settled;
    }

    const double k = constants.stiffness;
    const double c = constants.damping;
    const double x0 = state.target;
    const double dt = kStepMillis / 1000.0;

    double x = state.value;
    double v = state.velocity;

    const std::int64_t steps = subStepCount(elapsed_ms);
    for (std::int64_t i = 0; i < steps; ++i)
    {
        // Unit mass: force and acceleration coincide.
        const double force = -k * (x - x0) - c * v;
        v += force * dt;
        x += v * dt;
    }

    state.value = x;
    state.velocity = v;

    const bool finite = std::isfinite(x) && std::isfinite(v);
    if (!finite && !reported_non_finite_)
    {
        std::ostringstream details;
        details << "value=" << x << " velocity=" << v << " k=" << k << " c=" << c;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Numeric,
                                            "Spring motion diverged; check duration and damping ratio",
                                            details.str());
        reported_non_finite_ = true;
    }
    else if (finite)
    {
        reported_non_finite_ = false;
    }

    return StepResult::Moving;
}

} // namespace springy
