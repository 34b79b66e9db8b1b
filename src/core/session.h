#pragma once
#include <optional>
#include <glm/glm.hpp>
#include "config.h"
#include "diagnostic_log.h"
#include "../data/geometry_registry.h"
#include "../data/simulation_data.h"
#include "../rendering/camera/camera_controller.h"
#include "../scene/frame_cursor.h"

// Everything the viewer knows about the current session. Passed by reference to
// the loader, the renderer, the camera input path and the UI.
//
// The loader writes metadata and the geometry table, then sets `loaded`; after
// that they are only read.
struct Session
{
    std::optional<SimulationMetadata> metadata;
    GeometryRegistry registry;
    FrameCursor cursor;
    CameraController camera;
    DiagnosticLog log;
    glm::vec3 backgroundColor = config::DEFAULT_BACKGROUND_COLOR;
    bool loaded = false;

    int getFrameCount() const { return metadata ? metadata->frameCount : 0; }
    int getDimension() const { return metadata ? metadata->dimension : 3; }
};
