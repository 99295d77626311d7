#include "SpringSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <sstream>
#include <utility>

namespace
{

constexpr const char* kInitialValue = "initial_value";
constexpr const char* kValue = "value";
constexpr const char* kInitialVelocity = "initial_velocity";
constexpr const char* kDuration = "duration";
constexpr const char* kDampingRatio = "damping_ratio";
constexpr const char* kPreset = "preset";

void readReal(const toml::table& section, const char* key, std::optional<double>& out)
{
    const toml::node* node = section.get(key);
    if (!node)
        return;

    if (auto v = node->value<double>())
    {
        out = *v;
        return;
    }

    std::ostringstream details;
    details << "type=" << node->type();
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        std::string("Spring setting '") + key + "' must be a number; ignoring it",
                                        details.str());
}

void writeReal(toml::table& t, const char* key, const std::optional<double>& value)
{
    if (value)
        t.insert(key, *value);
}

} // namespace

SpringSettings::SpringSettings(const springy::SpringOptions& defaults)
    : options_(defaults)
{
}

void SpringSettings::registerConfigHandler(ConfigManager& config, const std::string& path)
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) {
        std::optional<springy::SpringPreset> preset;
        springy::SpringOptions loaded = deserialize(section, preset);
        preset_ = preset;
        update(loaded);
    };
    cb.save = [this]() -> toml::table {
        return serialize(options_.get(), preset_);
    };

    if (!config.registerTable(path, std::move(cb),
                              { kInitialValue, kValue, kInitialVelocity, kDuration, kDampingRatio, kPreset }))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration,
                                          "Spring settings will not be loaded or saved", config.lastError());
    }
}

void SpringSettings::update(const springy::SpringOptions& options)
{
    if (options_.set(options))
    {
        PLOG_DEBUG << "Spring options changed: duration=" << options.effectiveDuration()
                   << " damping_ratio=" << options.effectiveDampingRatio() << " value=" << options.target();
    }
}

void SpringSettings::setDuration(double duration)
{
    springy::SpringOptions next = options_.get();
    next.duration = duration;
    update(next);
}

void SpringSettings::setDampingRatio(double damping_ratio)
{
    if (preset_ && springy::dampingRatioFor(*preset_) != damping_ratio)
        preset_.reset();

    springy::SpringOptions next = options_.get();
    next.damping_ratio = damping_ratio;
    update(next);
}

void SpringSettings::setTarget(double value)
{
    springy::SpringOptions next = options_.get();
    next.value = value;
    update(next);
}

void SpringSettings::applyPreset(springy::SpringPreset preset)
{
    preset_ = preset;
    springy::SpringOptions next = options_.get();
    next.damping_ratio = springy::dampingRatioFor(preset);
    update(next);
}

springy::SpringOptions SpringSettings::deserialize(const toml::table& section,
                                                   std::optional<springy::SpringPreset>& preset)
{
    springy::SpringOptions options;
    readReal(section, kInitialValue, options.initial_value);
    readReal(section, kValue, options.value);
    readReal(section, kInitialVelocity, options.initial_velocity);
    readReal(section, kDuration, options.duration);
    readReal(section, kDampingRatio, options.damping_ratio);

    preset.reset();
    if (const toml::node* node = section.get(kPreset))
    {
        auto name = node->value<std::string>();
        if (name)
            preset = springy::parsePreset(*name);

        if (!preset)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown spring preset; expected smooth, snappy or bouncy",
                                                "preset=" + name.value_or("<not a string>"));
        }
    }

    // An explicit damping_ratio wins over the preset.
    if (preset && !options.damping_ratio)
        options.damping_ratio = springy::dampingRatioFor(*preset);

    return options;
}

toml::table SpringSettings::serialize(const springy::SpringOptions& options,
                                      const std::optional<springy::SpringPreset>& preset)
{
    toml::table t;
    writeReal(t, kInitialValue, options.initial_value);
    writeReal(t, kValue, options.value);
    writeReal(t, kInitialVelocity, options.initial_velocity);
    writeReal(t, kDuration, options.duration);
    writeReal(t, kDampingRatio, options.damping_ratio);
    if (preset)
        t.insert(kPreset, std::string(springy::presetName(*preset)));
    return t;
}
