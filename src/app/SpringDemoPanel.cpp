#include "SpringDemoPanel.hpp"
#include "config/ConfigManager.hpp"
#include "config/SpringSettings.hpp"
#include "springy/Spring.hpp"

#include <imgui.h>
#include <plog/Log.h>

#include <algorithm>
#include <cmath>

namespace
{

const char* const kPresetLabels[] = { "smooth (1.0)", "snappy (0.85)", "bouncy (0.7)", "custom" };
constexpr springy::SpringPreset kPresets[] = { springy::SpringPreset::Smooth, springy::SpringPreset::Snappy,
                                               springy::SpringPreset::Bouncy };

ImVec4 severityColor(utils::ErrorSeverity severity)
{
    switch (severity)
    {
    case utils::ErrorSeverity::Info:
        return ImVec4(0.6f, 0.8f, 1.0f, 1.0f);
    case utils::ErrorSeverity::Warning:
        return ImVec4(1.0f, 0.8f, 0.3f, 1.0f);
    case utils::ErrorSeverity::Error:
    case utils::ErrorSeverity::Fatal:
        return ImVec4(1.0f, 0.4f, 0.4f, 1.0f);
    }
    return ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
}

} // namespace

SpringDemoPanel::SpringDemoPanel(springy::Spring& spring, SpringSettings& settings, ConfigManager& config)
    : spring_(spring)
    , settings_(settings)
    , config_(config)
{
}

void SpringDemoPanel::render()
{
    recordSample();

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;

    if (ImGui::Begin("Spring", nullptr, flags))
    {
        renderControls();
        renderTrack();
        renderHistory();
        ImGui::Separator();
        renderReadouts();
        ImGui::Separator();
        renderParameters();
        ImGui::Separator();
        renderDiagnostics();
    }
    ImGui::End();
}

void SpringDemoPanel::recordSample()
{
    history_[history_head_] = static_cast<float>(spring_.value());
    history_head_ = (history_head_ + 1) % kHistorySize;
}

void SpringDemoPanel::renderControls()
{
    if (ImGui::Button("Toggle"))
    {
        if (spring_.value() > 0.5)
        {
            spring_.set(0.0);
        }
        else
        {
            spring_.set(1.0, { .on_complete = [this] {
                               ++completions_;
                               PLOG_INFO << "Spring reached 1 (" << completions_ << " completion(s) so far)";
                           } });
        }
    }

    ImGui::SameLine();
    if (ImGui::Button("Bonk"))
    {
        spring_.reset(0.0, 20.0);
        spring_.set(1.0);
    }

    ImGui::SameLine();
    if (ImGui::Button("Stop"))
        spring_.stop();

    ImGui::SameLine();
    ImGui::TextDisabled("completions: %d", completions_);
}

void SpringDemoPanel::renderTrack()
{
    const float width = ImGui::GetContentRegionAvail().x;
    const float height = 36.0f;
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    ImDrawList* dl = ImGui::GetWindowDrawList();

    auto toX = [&](double v) {
        const double t = (v - kTrackMin) / (kTrackMax - kTrackMin);
        return origin.x + static_cast<float>(std::clamp(t, 0.0, 1.0)) * width;
    };

    const float mid_y = origin.y + height * 0.5f;
    dl->AddRectFilled(ImVec2(origin.x, mid_y - 3.0f), ImVec2(origin.x + width, mid_y + 3.0f),
                      IM_COL32(70, 70, 80, 255), 3.0f);

    for (double mark : { 0.0, 1.0 })
    {
        const float x = toX(mark);
        dl->AddLine(ImVec2(x, origin.y + 4.0f), ImVec2(x, origin.y + height - 4.0f), IM_COL32(120, 120, 130, 255));
    }

    const float target_x = toX(spring_.target());
    dl->AddTriangleFilled(ImVec2(target_x - 6.0f, origin.y), ImVec2(target_x + 6.0f, origin.y),
                          ImVec2(target_x, origin.y + 8.0f), IM_COL32(240, 180, 60, 255));

    const double value = spring_.value();
    if (std::isfinite(value))
        dl->AddCircleFilled(ImVec2(toX(value), mid_y), 9.0f, IM_COL32(90, 170, 250, 255));

    ImGui::Dummy(ImVec2(width, height));
}

void SpringDemoPanel::renderHistory()
{
    ImGui::PlotLines("##history", history_.data(), static_cast<int>(kHistorySize), static_cast<int>(history_head_),
                     "value", kTrackMin, kTrackMax, ImVec2(ImGui::GetContentRegionAvail().x, 120.0f));
}

void SpringDemoPanel::renderReadouts()
{
    const auto& constants = spring_.constants();
    ImGui::Text("value    %+.4f", spring_.value());
    ImGui::Text("velocity %+.4f", spring_.velocity());
    ImGui::Text("target   %+.4f", spring_.target());
    ImGui::Text("k = %.3f   c = %.3f", constants.stiffness, constants.damping);
    ImGui::Text("%s, %zu pending completion(s)", spring_.isAnimating() ? "animating" : "idle",
                spring_.pendingCompletions());
}

void SpringDemoPanel::renderParameters()
{
    const springy::SpringOptions& options = settings_.current();

    float duration = static_cast<float>(options.effectiveDuration());
    if (ImGui::SliderFloat("duration (s)", &duration, 0.05f, 3.0f, "%.2f"))
        settings_.setDuration(duration);

    float ratio = static_cast<float>(options.effectiveDampingRatio());
    if (ImGui::SliderFloat("damping ratio", &ratio, 0.0f, 2.0f, "%.2f"))
        settings_.setDampingRatio(ratio);

    int preset_index = 3;
    if (auto preset = settings_.preset())
        preset_index = static_cast<int>(*preset);
    if (ImGui::Combo("preset", &preset_index, kPresetLabels, IM_ARRAYSIZE(kPresetLabels)) && preset_index < 3)
        settings_.applyPreset(kPresets[preset_index]);

    float configured = static_cast<float>(options.target());
    if (ImGui::SliderFloat("configured value", &configured, kTrackMin, kTrackMax, "%.3f"))
        settings_.setTarget(configured);

    if (ImGui::Button("Save"))
    {
        if (config_.save())
            PLOG_INFO << "Spring settings saved";
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%s", config_.path().c_str());
}

void SpringDemoPanel::renderDiagnostics()
{
    for (auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        reports_.push_back(std::move(report));
        if (reports_.size() > kMaxReports)
            reports_.pop_front();
    }

    if (!ImGui::CollapsingHeader("Diagnostics", reports_.empty() ? 0 : ImGuiTreeNodeFlags_DefaultOpen))
        return;

    if (reports_.empty())
    {
        ImGui::TextDisabled("No problems reported");
        return;
    }

    for (const auto& report : reports_)
    {
        ImGui::PushStyleColor(ImGuiCol_Text, severityColor(report.severity));
        ImGui::TextWrapped("[%s] %s: %s", report.timestamp.c_str(),
                           utils::ErrorReporter::CategoryToString(report.category).c_str(),
                           report.user_message.c_str());
        ImGui::PopStyleColor();
        if (!report.technical_details.empty())
            ImGui::TextDisabled("    %s", report.technical_details.c_str());
    }

    if (ImGui::Button("Clear"))
        reports_.clear();
}
