#pragma once

#include <optional>
#include <string_view>

namespace springy
{

// Physical coefficients of a unit-mass damped oscillator.
struct SpringConstants
{
    double stiffness = 0.0; // k
    double damping = 0.0;   // c
};

// Damping ratios named after how the motion feels.
enum class SpringPreset
{
    Smooth, // 1.0, critically damped
    Snappy, // 0.85
    Bouncy  // 0.7
};

/**
 * @brief Spring constant for a given oscillation period, k = 4*pi^2 / duration^2.
 *
 * Not validated: a zero duration yields +inf, a negative one the same value as
 * its absolute value.
 */
double springConstant(double duration);

/**
 * @brief Viscous damping coefficient, c = ratio * 2 * sqrt(k); 0 when k <= 0.
 */
double dampingConstant(double damping_ratio, double spring_constant);

SpringConstants deriveConstants(double duration, double damping_ratio);

// True when the pair produces a physically meaningful oscillator.
bool parametersWellFormed(double duration, double damping_ratio);

double dampingRatioFor(SpringPreset preset);
const char* presetName(SpringPreset preset);
std::optional<SpringPreset> parsePreset(std::string_view name);

} // namespace springy
