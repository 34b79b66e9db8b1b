#include "camera_controller.h"
#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

CameraController::CameraController()
{
    reset();
}

void CameraController::configure(int newDimension, const glm::vec3& newBoxExtent)
{
    dimension = newDimension;
    boxExtent = newBoxExtent;
    reset();
}

void CameraController::reset()
{
    center = boxExtent * 0.5f;
    panCenter = glm::vec2(center.x, center.y);
    halfExtent = config::INITIAL_HALF_EXTENT_SCALE * std::max(boxExtent.x, boxExtent.y);
    if (halfExtent <= 0.0f)
        halfExtent = 1.0f;

    yaw = 0.0f;
    pitch = 0.0f;
    distance = config::INITIAL_DISTANCE_SCALE * glm::length(boxExtent);
    if (distance <= 0.0f)
        distance = 1.0f;

    dragging = false;
}

void CameraController::setViewport(int width, int height)
{
    if (width > 0 && height > 0)
    {
        viewportWidth = width;
        viewportHeight = height;
    }
}

void CameraController::beginDrag(const glm::vec2& cursor)
{
    dragging = true;
    dragStart = cursor;
    dragCurrent = cursor;
}

void CameraController::dragTo(const glm::vec2& cursor)
{
    if (dragging)
        dragCurrent = cursor;
}

void CameraController::endDrag(const glm::vec2& cursor)
{
    if (!dragging)
        return;
    dragCurrent = cursor;

    if (dimension == 2)
        panCenter = getLivePanCenter();
    else
    {
        yaw = getLiveYaw();
        pitch = getLivePitch();
    }
    dragging = false;
}

void CameraController::zoom(float wheelSteps)
{
    // Positive steps zoom in
    float scale = std::pow(zoomFactor, -wheelSteps);
    if (dimension == 2)
        halfExtent *= scale;
    else
        distance *= scale;
}

float CameraController::getLiveYaw() const
{
    if (!dragging)
        return yaw;
    return yaw - dragOffset().x * orbitSensitivity;
}

float CameraController::getLivePitch() const
{
    float livePitch = dragging ? pitch + dragOffset().y * orbitSensitivity : pitch;
    return std::clamp(livePitch, -config::PITCH_LIMIT, config::PITCH_LIMIT);
}

glm::vec2 CameraController::getLivePanCenter() const
{
    if (!dragging)
        return panCenter;
    // One window height spans two half-extents
    float worldPerPixel = 2.0f * halfExtent / static_cast<float>(viewportHeight);
    glm::vec2 offset = dragOffset();
    return panCenter + glm::vec2(-offset.x, offset.y) * worldPerPixel;
}

glm::vec3 CameraController::getEyePosition() const
{
    if (dimension == 2)
    {
        glm::vec2 live = getLivePanCenter();
        return glm::vec3(live, 1.0f);
    }
    float liveYaw = getLiveYaw();
    float livePitch = getLivePitch();
    glm::vec3 direction(std::cos(livePitch) * std::sin(liveYaw),
                        std::sin(livePitch),
                        std::cos(livePitch) * std::cos(liveYaw));
    return center + direction * distance;
}

glm::mat4 CameraController::getViewMatrix() const
{
    if (dimension == 2)
    {
        glm::vec2 live = getLivePanCenter();
        return glm::translate(glm::mat4(1.0f), glm::vec3(-live, 0.0f));
    }
    return glm::lookAt(getEyePosition(), center, config::WORLD_UP);
}

glm::mat4 CameraController::getProjectionMatrix() const
{
    float aspect = static_cast<float>(viewportWidth) / static_cast<float>(viewportHeight);
    if (dimension == 2)
        return glm::ortho(-halfExtent * aspect, halfExtent * aspect, -halfExtent, halfExtent, -1.0f, 1.0f);

    float farPlane = distance + 2.0f * glm::length(boxExtent) + 1.0f;
    return glm::perspective(glm::radians(config::CAMERA_FOV_DEGREES), aspect, config::CAMERA_NEAR_PLANE * distance, farPlane);
}
