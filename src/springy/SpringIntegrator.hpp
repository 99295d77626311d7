#pragma once

#include "SpringParameters.hpp"

#include <cstdint>

namespace springy
{

struct SpringState
{
    double value = 0.0;
    double velocity = 0.0;
    double target = 0.0; // equilibrium
};

enum class StepResult
{
    Moving,  // more stepping needed
    Settled  // value/velocity were snapped to target/0
};

/**
 * @brief Fixed-step semi-implicit Euler integrator for a unit-mass spring.
 *
 * Each step() first checks settlement against the state's current target.
 * A settled state is snapped exactly onto the target and reported as
 * Settled without stepping; otherwise the elapsed time is consumed in
 * whole 1 ms sub-steps (the fractional remainder is dropped).
 */
class SpringIntegrator
{
public:
    static constexpr double kSettleEpsilon = 0.001;
    static constexpr double kStepMillis = 1.0;

    StepResult step(SpringState& state, const SpringConstants& constants, double elapsed_ms);

    static bool isSettled(const SpringState& state);
    static std::int64_t subStepCount(double elapsed_ms);

private:
    bool reported_non_finite_ = false;
};

} // namespace springy
