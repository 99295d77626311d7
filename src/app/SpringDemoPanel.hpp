#pragma once

#include "utils/ErrorReporter.hpp"

#include <array>
#include <cstddef>
#include <deque>

namespace springy
{
class Spring;
}

class SpringSettings;
class ConfigManager;

// Single ImGui window that pokes a spring and shows how it moves.
class SpringDemoPanel
{
public:
    SpringDemoPanel(springy::Spring& spring, SpringSettings& settings, ConfigManager& config);

    void render();

private:
    void recordSample();
    void renderControls();
    void renderTrack();
    void renderHistory();
    void renderReadouts();
    void renderParameters();
    void renderDiagnostics();

    springy::Spring& spring_;
    SpringSettings& settings_;
    ConfigManager& config_;

    static constexpr std::size_t kHistorySize = 240;
    static constexpr float kTrackMin = -1.0f;
    static constexpr float kTrackMax = 2.0f;
    static constexpr std::size_t kMaxReports = 20;

    std::array<float, kHistorySize> history_{};
    std::size_t history_head_ = 0;
    int completions_ = 0;
    std::deque<utils::ErrorReport> reports_;
};
