#include "ui_manager.h"
#include "imgui.h"
#include <algorithm>
#include "../core/config.h"
#include "../core/diagnostic_log.h"

void UIManager::renderDiagnostics(const DiagnosticLog& log)
{
    ImGui::SetNextWindowPos(ImVec2(15, 470), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(520, 220), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Diagnostics", &config::showDiagnosticsWindow, getWindowFlags()))
    {
        if (log.empty())
        {
            ImGui::TextDisabled("No problems reported");
        }
        else
        {
            ImGui::Text("%zu problem(s)", log.size());
            ImGui::Separator();
            ImGui::BeginChild("##DiagnosticEntries");
            for (const DiagnosticEntry& entry : log.entries())
            {
                ImVec4 color = entry.kind == ErrorKind::ShaderBuildFailure ? ImVec4(1.0f, 0.3f, 0.3f, 1.0f)
                                                                           : ImVec4(1.0f, 0.8f, 0.0f, 1.0f);
                ImGui::TextColored(color, "%s", errorKindName(entry.kind));
                ImGui::SameLine();
                ImGui::TextWrapped("%s", entry.message.c_str());
            }
            // Follow new entries
            if (log.size() != lastDiagnosticCount)
            {
                ImGui::SetScrollHereY(1.0f);
                lastDiagnosticCount = log.size();
            }
            ImGui::EndChild();
        }
    }
    ImGui::End();
}

void UIManager::renderFatalError(const DiagnosticLog& log)
{
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->GetCenter(), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(std::min(640.0f, viewport->Size.x * 0.9f), 0.0f), ImGuiCond_Always);

    ImGui::PushStyleColor(ImGuiCol_WindowBg, ImVec4(0.45f, 0.05f, 0.05f, 0.97f));
    ImGui::PushStyleColor(ImGuiCol_TitleBgActive, ImVec4(0.75f, 0.1f, 0.1f, 1.0f));
    ImGui::PushStyleColor(ImGuiCol_TitleBg, ImVec4(0.75f, 0.1f, 0.1f, 1.0f));
    ImGuiWindowFlags flags = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse |
                             ImGuiWindowFlags_AlwaysAutoResize;
    if (ImGui::Begin("Rendering stopped", nullptr, flags))
    {
        ImGui::TextWrapped("The shaders could not be built, nothing will be drawn.");
        ImGui::Separator();
        for (const DiagnosticEntry& entry : log.entries())
        {
            if (entry.kind == ErrorKind::ShaderBuildFailure)
                ImGui::TextWrapped("%s", entry.message.c_str());
        }
    }
    ImGui::End();
    ImGui::PopStyleColor(3);
}

void UIManager::updatePerformanceMetrics(PerformanceMonitor& perfMonitor, float deltaTime)
{
    float frameTimeMs = deltaTime * 1000.0f;

    perfMonitor.minFrameTime = std::min(perfMonitor.minFrameTime, frameTimeMs);
    perfMonitor.maxFrameTime = std::max(perfMonitor.maxFrameTime, frameTimeMs);

    perfMonitor.frameTimeHistory.push_back(frameTimeMs);
    if (perfMonitor.frameTimeHistory.size() > PerformanceMonitor::HISTORY_SIZE)
        perfMonitor.frameTimeHistory.erase(perfMonitor.frameTimeHistory.begin());

    float sum = 0.0f;
    for (float ft : perfMonitor.frameTimeHistory)
        sum += ft;
    perfMonitor.avgFrameTime = sum / perfMonitor.frameTimeHistory.size();

    // FPS readout is refreshed a few times per second so it stays readable
    perfMonitor.frameCount++;
    perfMonitor.frameTimeAccumulator += deltaTime;
    perfMonitor.lastPerfUpdate += deltaTime;
    if (perfMonitor.lastPerfUpdate >= perfMonitor.perfUpdateInterval)
    {
        perfMonitor.displayFPS = perfMonitor.frameCount / perfMonitor.frameTimeAccumulator;
        perfMonitor.displayFrameTime = 1000.0f * perfMonitor.frameTimeAccumulator / perfMonitor.frameCount;
        perfMonitor.frameCount = 0;
        perfMonitor.frameTimeAccumulator = 0.0f;
        perfMonitor.lastPerfUpdate = 0.0f;
    }
}

int UIManager::getWindowFlags(int baseFlags) const
{
    if (windowsLocked)
    {
        // Remove AlwaysAutoResize flag if present since it conflicts with NoResize
        int lockedFlags = baseFlags & ~ImGuiWindowFlags_AlwaysAutoResize;
        return lockedFlags | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
    }
    return baseFlags;
}

void UIManager::addTooltip(const char* tooltip)
{
    ImGui::SameLine();
    ImGui::TextDisabled("(?)");
    if (ImGui::IsItemHovered())
    {
        ImGui::SetTooltip("%s", tooltip);
    }
}
