#pragma once
#include <vector>

struct Session;
class ChunkedLoader;
struct RenderStats;
class DiagnosticLog;

struct PerformanceMonitor
{
    float lastPerfUpdate = 0.0f;
    float perfUpdateInterval = 0.25f; // Update every 250ms
    float displayFPS = 0.0f;
    float displayFrameTime = 0.0f;
    int frameCount = 0;
    float frameTimeAccumulator = 0.0f;

    float minFrameTime = 1000.0f;
    float maxFrameTime = 0.0f;
    float avgFrameTime = 0.0f;
    std::vector<float> frameTimeHistory;
    static constexpr int HISTORY_SIZE = 120; // 2 seconds at 60fps
};

class UIManager
{
public:
    // `loader` is null when the host could not be started
    void renderPlaybackControls(Session& session, const ChunkedLoader* loader);
    void renderCameraControls(Session& session);
    void renderDiagnostics(const DiagnosticLog& log);
    void renderPerformanceMonitor(PerformanceMonitor& perfMonitor, const RenderStats& stats);
    // Red modal that stays up for the rest of the run
    void renderFatalError(const DiagnosticLog& log);

    void updatePerformanceMetrics(PerformanceMonitor& perfMonitor, float deltaTime);

private:
    int getWindowFlags(int baseFlags = 0) const;
    void addTooltip(const char* tooltip);

    int scrubFrame = 0;
    bool scrubbing = false;
    size_t lastDiagnosticCount = 0;
    bool windowsLocked = false;
};
