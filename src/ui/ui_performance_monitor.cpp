#include "ui_manager.h"
#include "imgui.h"
#include "../core/config.h"
#include "../rendering/systems/trajectory_renderer.h"
#include "../utils/timer.h"

void UIManager::renderPerformanceMonitor(PerformanceMonitor& perfMonitor, const RenderStats& stats)
{
    ImGui::SetNextWindowPos(ImVec2(550, 15), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360, 380), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Performance Monitor", &config::showPerformanceWindow, getWindowFlags()))
    {
        ImGui::Text("FPS: ");
        ImGui::SameLine();
        ImVec4 fpsColor = perfMonitor.displayFPS >= 59.0f ? ImVec4(0, 1, 0, 1) : perfMonitor.displayFPS >= 30.0f ? ImVec4(1, 1, 0, 1)
                                                                                                                 : ImVec4(1, 0, 0, 1);
        ImGui::TextColored(fpsColor, "%.1f", perfMonitor.displayFPS);
        ImGui::Text("Frame Time: %.3f ms", perfMonitor.displayFrameTime);
        ImGui::Text("Min/Avg/Max: %.2f/%.2f/%.2f ms", perfMonitor.minFrameTime, perfMonitor.avgFrameTime, perfMonitor.maxFrameTime);
        if (!perfMonitor.frameTimeHistory.empty())
        {
            ImGui::PlotLines("##FrameTimes", perfMonitor.frameTimeHistory.data(),
                             static_cast<int>(perfMonitor.frameTimeHistory.size()), 0, "Frame Time (ms)", 0.0f, 50.0f,
                             ImVec2(ImGui::GetContentRegionAvail().x, 60));
        }
        ImGui::Separator();

        ImGui::Text("Draw calls: %d", stats.drawCalls);
        ImGui::Text("Instances: %d", stats.instancesDrawn);
        ImGui::Text("Bonds: %d (%d vertices)", stats.bondsDrawn, stats.bondVertices);
        ImGui::Text("Bonds across the periodic boundary: %d", stats.bondsWrapRejected);
        addTooltip("Skipped because the two ends are more than half a box apart");
        ImGui::Separator();

        if (ImGui::BeginTable("##Timers", 3, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV))
        {
            ImGui::TableSetupColumn("Timer");
            ImGui::TableSetupColumn("Avg (ms)");
            ImGui::TableSetupColumn("Max (ms)");
            ImGui::TableHeadersRow();
            for (auto& [name, timer] : TimerManager::instance().getTimers())
            {
                ImGui::TableNextRow();
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(name.c_str());
                ImGui::TableNextColumn();
                ImGui::Text("%.3f", timer.averageTimeMs);
                ImGui::TableNextColumn();
                ImGui::Text("%.3f", timer.maxTimeMs);
            }
            ImGui::EndTable();
        }
    }
    ImGui::End();
}
