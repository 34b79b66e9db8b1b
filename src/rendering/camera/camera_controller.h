#pragma once
#include <glm/glm.hpp>
#include "../../core/config.h"

// Turns pointer drags and wheel steps into view parameters.
//
// 2D: the camera looks straight down -Z. Dragging pans, the wheel scales the
// visible half-extent.
// 3D: the camera orbits the box midpoint. Dragging changes yaw/pitch, the wheel
// scales the orbit distance.
//
// A drag only previews its change; the new view is committed on release.
class CameraController
{
public:
    CameraController();

    // Called once the simulation metadata is known
    void configure(int dimension, const glm::vec3& boxExtent);
    void reset();
    void setViewport(int width, int height);

    // Pointer input, cursor in window pixels with y pointing down
    void beginDrag(const glm::vec2& cursor);
    void dragTo(const glm::vec2& cursor);
    void endDrag(const glm::vec2& cursor);
    void zoom(float wheelSteps);

    glm::mat4 getViewMatrix() const;
    glm::mat4 getProjectionMatrix() const;
    glm::vec3 getEyePosition() const;

    int getDimension() const { return dimension; }
    bool isDragging() const { return dragging; }
    float getYaw() const { return yaw; }
    float getPitch() const { return pitch; }
    float getDistance() const { return distance; }
    float getHalfExtent() const { return halfExtent; }
    glm::vec2 getPanCenter() const { return panCenter; }
    glm::vec3 getLookAtCenter() const { return center; }

    // Values including the uncommitted drag
    float getLiveYaw() const;
    float getLivePitch() const;
    glm::vec2 getLivePanCenter() const;

    float orbitSensitivity = config::ORBIT_SENSITIVITY;
    float zoomFactor = config::ZOOM_FACTOR;

private:
    glm::vec2 dragOffset() const { return dragCurrent - dragStart; }

    int dimension = 3;
    glm::vec3 boxExtent{ 1.0f };
    glm::vec3 center{ 0.5f };
    int viewportWidth = config::INITIAL_WINDOW_WIDTH;
    int viewportHeight = config::INITIAL_WINDOW_HEIGHT;

    // 2D state
    glm::vec2 panCenter{ 0.5f };
    float halfExtent = 1.0f;

    // 3D state
    float yaw = 0.0f;
    float pitch = 0.0f;
    float distance = 1.0f;

    bool dragging = false;
    glm::vec2 dragStart{ 0.0f };
    glm::vec2 dragCurrent{ 0.0f };
};
