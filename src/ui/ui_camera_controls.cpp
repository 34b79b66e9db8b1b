#include "ui_manager.h"
#include "imgui.h"
#include "../core/session.h"

void UIManager::renderCameraControls(Session& session)
{
    ImGui::SetNextWindowPos(ImVec2(15, 180), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(320, 270), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Camera & Controls", nullptr, getWindowFlags()))
    {
        CameraController& camera = session.camera;
        if (camera.getDimension() == 2)
        {
            glm::vec2 center = camera.getLivePanCenter();
            ImGui::Text("Center: (%.2f, %.2f)", center.x, center.y);
            ImGui::Text("Half extent: %.3f", camera.getHalfExtent());
        }
        else
        {
            glm::vec3 eye = camera.getEyePosition();
            ImGui::Text("Eye: (%.2f, %.2f, %.2f)", eye.x, eye.y, eye.z);
            ImGui::Text("Yaw %.2f  Pitch %.2f  Distance %.2f", camera.getLiveYaw(), camera.getLivePitch(), camera.getDistance());
        }
        if (ImGui::Button("Reset Camera"))
            camera.reset();
        ImGui::Separator();

        ImGui::SliderFloat("Orbit sensitivity", &camera.orbitSensitivity, 0.001f, 0.05f, "%.3f");
        addTooltip("Radians of yaw/pitch per dragged pixel (3D)");
        ImGui::SliderFloat("Zoom factor", &camera.zoomFactor, 1.01f, 2.0f, "%.2f");
        addTooltip("Zoom multiplier per wheel step");
        ImGui::Separator();

        ImGui::Text("Controls:");
        ImGui::BulletText("Left-drag - %s", camera.getDimension() == 2 ? "Pan" : "Orbit");
        ImGui::BulletText("Scroll Wheel - Zoom");
        ImGui::BulletText("Space - Play / Pause");
        ImGui::BulletText("Left/Right - Step frame (paused)");
        ImGui::BulletText("R - Reset camera");
        ImGui::Separator();

        if (ImGui::Button(windowsLocked ? "Unlock All Windows" : "Lock All Windows"))
            windowsLocked = !windowsLocked;
        ImGui::Checkbox("Performance window", &config::showPerformanceWindow);
        ImGui::Checkbox("Diagnostics window", &config::showDiagnosticsWindow);
    }
    ImGui::End();
}
