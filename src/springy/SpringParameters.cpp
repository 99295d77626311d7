#include "SpringParameters.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <string>

namespace springy
{

double springConstant(double duration)
{
    return (4.0 * std::numbers::pi * std::numbers::pi) / (duration * duration);
}

double dampingConstant(double damping_ratio, double spring_constant)
{
    if (spring_constant <= 0.0)
        return 0.0;
    return damping_ratio * 2.0 * std::sqrt(spring_constant);
}

SpringConstants deriveConstants(double duration, double damping_ratio)
{
    SpringConstants constants;
    constants.stiffness = springConstant(duration);
    constants.damping = dampingConstant(damping_ratio, constants.stiffness);
    return constants;
}

bool parametersWellFormed(double duration, double damping_ratio)
{
    return std::isfinite(duration) && duration > 0.0 && std::isfinite(damping_ratio) && damping_ratio >= 0.0;
}

double dampingRatioFor(SpringPreset preset)
{
    switch (preset)
    {
    case SpringPreset::Smooth:
        return 1.0;
    case SpringPreset::Snappy:
        return 0.85;
    case SpringPreset::Bouncy:
        return 0.7;
    }
    return 1.0;
}

const char* presetName(SpringPreset preset)
{
    switch (preset)
    {
    case SpringPreset::Smooth:
        return "smooth";
    case SpringPreset::Snappy:
        return "snappy";
    case SpringPreset::Bouncy:
        return "bouncy";
    }
    return "smooth";
}

std::optional<SpringPreset> parsePreset(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "smooth")
        return SpringPreset::Smooth;
    if (lowered == "snappy")
        return SpringPreset::Snappy;
    if (lowered == "bouncy")
        return SpringPreset::Bouncy;
    return std::nullopt;
}

} // namespace springy
