#pragma once

#include "springy/Observable.hpp"
#include "springy/SpringOptions.hpp"
#include "springy/SpringParameters.hpp"

#include <optional>
#include <string>

#include <toml++/toml.h>

class ConfigManager;

// Owns the live spring options of the application and maps them to the
// [spring] table of config.toml.
class SpringSettings
{
public:
    SpringSettings() = default;
    explicit SpringSettings(const springy::SpringOptions& defaults);

    void registerConfigHandler(ConfigManager& config, const std::string& path = "spring");

    springy::Observable<springy::SpringOptions>& options() { return options_; }
    const springy::SpringOptions& current() const { return options_.get(); }

    void update(const springy::SpringOptions& options);
    void setDuration(double duration);
    void setDampingRatio(double damping_ratio);
    void setTarget(double value);
    void applyPreset(springy::SpringPreset preset);
    std::optional<springy::SpringPreset> preset() const { return preset_; }

    // Unknown presets and non-numeric values are reported and skipped.
    static springy::SpringOptions deserialize(const toml::table& section,
                                              std::optional<springy::SpringPreset>& preset);
    static toml::table serialize(const springy::SpringOptions& options,
                                 const std::optional<springy::SpringPreset>& preset);

private:
    springy::Observable<springy::SpringOptions> options_;
    std::optional<springy::SpringPreset> preset_;
};
