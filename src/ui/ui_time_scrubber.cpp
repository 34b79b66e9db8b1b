#include "ui_manager.h"
#include "imgui.h"
#include <algorithm>
#include "../core/session.h"
#include "../loading/chunked_loader.h"

void UIManager::renderPlaybackControls(Session& session, const ChunkedLoader* loader)
{
    ImGui::SetNextWindowPos(ImVec2(15, 15), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(520, 150), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Playback", nullptr, getWindowFlags()))
    {
        FrameCursor& cursor = session.cursor;
        const int frameCount = session.getFrameCount();

        if (loader && !loader->isFinished())
        {
            ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.0f, 1.0f), "Loading...");
            ImGui::SameLine();
            ImGui::TextWrapped("%s", loader->getActivity().c_str());
            ImGui::Text("Chunks received: %d", loader->getChunksLoaded());
        }
        else if (!session.loaded)
        {
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "Loading failed, see Diagnostics");
        }

        // Controls stay visible while loading but do nothing until the data is in
        ImGui::BeginDisabled(!session.loaded);
        if (ImGui::Button(cursor.isPlaying() ? "Pause" : "Play", ImVec2(70, 0)))
            cursor.togglePlaying();
        ImGui::SameLine();
        ImGui::BeginDisabled(cursor.isPlaying());
        if (ImGui::ArrowButton("##StepBack", ImGuiDir_Left))
            cursor.step(-1, frameCount, session.loaded);
        ImGui::SameLine();
        if (ImGui::ArrowButton("##StepForward", ImGuiDir_Right))
            cursor.step(1, frameCount, session.loaded);
        ImGui::EndDisabled();
        ImGui::SameLine();
        ImGui::Text("Frame %d / %d   Loop %d", cursor.getShownFrame(), std::max(frameCount - 1, 0), cursor.getLoopCount());

        if (!scrubbing)
            scrubFrame = cursor.getShownFrame();
        ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x);
        bool changed = ImGui::SliderInt("##FrameSlider", &scrubFrame, 0, std::max(frameCount - 1, 0));
        scrubbing = ImGui::IsItemActive();
        if (changed)
        {
            // Scrubbing pauses playback so the chosen frame stays on screen
            cursor.setPlaying(false);
            cursor.scrubTo(scrubFrame, frameCount, session.loaded);
        }
        ImGui::EndDisabled();
    }
    ImGui::End();
}
