#include "input.h"
#include <imgui.h>
#include "../core/session.h"

namespace
{
    GLFWwindow* window = nullptr;
    bool currentMouseButtons[GLFW_MOUSE_BUTTON_LAST + 1];
    bool previousMouseButtons[GLFW_MOUSE_BUTTON_LAST + 1];
    bool currentKeys[GLFW_KEY_LAST + 1];
    bool previousKeys[GLFW_KEY_LAST + 1];
    float scrollDelta = 0.0f;      // Accumulated by the callback until the next update()
    float frameScroll = 0.0f;

    const int trackedKeys[] = { GLFW_KEY_SPACE, GLFW_KEY_LEFT, GLFW_KEY_RIGHT, GLFW_KEY_R };

    GLFWscrollfun previousScrollCallback = nullptr;
}

// Scroll wheel callback function
void scrollCallback(GLFWwindow* w, double xoffset, double yoffset)
{
    if (previousScrollCallback)
        previousScrollCallback(w, xoffset, yoffset);
    scrollDelta += static_cast<float>(yoffset);
}

void Input::init(GLFWwindow* _window)
{
    window = _window;
    for (int button = 0; button <= GLFW_MOUSE_BUTTON_LAST; ++button)
        currentMouseButtons[button] = previousMouseButtons[button] = false;
    for (int key = 0; key <= GLFW_KEY_LAST; ++key)
        currentKeys[key] = previousKeys[key] = false;
    scrollDelta = 0.0f;
    frameScroll = 0.0f;

    glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_NORMAL);

    // ImGui's GLFW backend may already own the scroll callback; keep it in the chain
    previousScrollCallback = glfwSetScrollCallback(window, scrollCallback);
}

void Input::update()
{
    for (int button = 0; button <= GLFW_MOUSE_BUTTON_LAST; ++button) {
        previousMouseButtons[button] = currentMouseButtons[button];
        currentMouseButtons[button] = glfwGetMouseButton(window, button) == GLFW_PRESS;
    }
    for (int key : trackedKeys) {
        previousKeys[key] = currentKeys[key];
        currentKeys[key] = glfwGetKey(window, key) == GLFW_PRESS;
    }

    frameScroll = scrollDelta;
    scrollDelta = 0.0f;
}

void Input::apply(Session& session)
{
    const ImGuiIO& io = ImGui::GetIO();
    CameraController& camera = session.camera;
    const glm::vec2 cursor = getMousePosition(false);

    // A drag that started in the viewport keeps going even over an ImGui window
    if (camera.isDragging())
    {
        if (isMouseButtonPressed(GLFW_MOUSE_BUTTON_LEFT))
            camera.dragTo(cursor);
        else
            camera.endDrag(cursor);
    }
    else if (!io.WantCaptureMouse && isMouseJustPressed(GLFW_MOUSE_BUTTON_LEFT))
    {
        camera.beginDrag(cursor);
    }

    if (!io.WantCaptureMouse && hasScrollInput())
        camera.zoom(frameScroll);

    if (io.WantCaptureKeyboard)
        return;

    FrameCursor& frames = session.cursor;
    if (isKeyJustPressed(GLFW_KEY_SPACE))
        frames.togglePlaying();
    if (!frames.isPlaying())
    {
        if (isKeyJustPressed(GLFW_KEY_LEFT))
            frames.step(-1, session.getFrameCount(), session.loaded);
        if (isKeyJustPressed(GLFW_KEY_RIGHT))
            frames.step(1, session.getFrameCount(), session.loaded);
    }
    if (isKeyJustPressed(GLFW_KEY_R))
        camera.reset();
}

bool Input::isKeyJustPressed(int key)
{
    return currentKeys[key] && !previousKeys[key];
}

bool Input::isMouseButtonPressed(int button)
{
    return glfwGetMouseButton(window, button) == GLFW_PRESS;
}

bool Input::isMouseJustPressed(int button)
{
    return currentMouseButtons[button] && !previousMouseButtons[button];
}

glm::vec2 Input::getMousePosition(bool flip_y) // Flips Y axis for OpenGL coordinates
{
    double x, y;
    glfwGetCursorPos(window, &x, &y);
    if (flip_y) {
        int width, height;
        glfwGetWindowSize(window, &width, &height);
        return { static_cast<float>(x), static_cast<float>(height) - static_cast<float>(y) };
    }
    return { static_cast<float>(x), static_cast<float>(y) };
}

bool Input::hasScrollInput()
{
    return frameScroll != 0.0f;
}
