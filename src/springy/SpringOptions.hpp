#pragma once

#include <optional>

namespace springy
{

/**
 * @brief User-facing spring configuration. Every field is optional.
 *
 * Defaults: initial_value -> value -> 0, value (the live target) -> 0,
 * initial_velocity -> 0, duration -> 1 s, damping_ratio -> 1.
 */
struct SpringOptions
{
    static constexpr double kDefaultDuration = 1.0;
    static constexpr double kDefaultDampingRatio = 1.0;

    std::optional<double> initial_value;
    std::optional<double> value;
    std::optional<double> initial_velocity;
    // Oscillation period in seconds, not the time to come to rest.
    std::optional<double> duration;
    // < 1 bouncy, 1 critically damped, > 1 sluggish
    std::optional<double> damping_ratio;

    bool operator==(const SpringOptions&) const = default;

    double startValue() const { return initial_value.value_or(value.value_or(0.0)); }
    double target() const { return value.value_or(0.0); }
    double startVelocity() const { return initial_velocity.value_or(0.0); }
    double effectiveDuration() const { return duration.value_or(kDefaultDuration); }
    double effectiveDampingRatio() const { return damping_ratio.value_or(kDefaultDampingRatio); }
};

} // namespace springy
