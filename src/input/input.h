#pragma once
#include <glm/vec2.hpp>
#include <GLFW/glfw3.h>

struct Session;

// Polled GLFW input, plus the viewer's bindings:
//   left drag   camera pan (2D) / orbit (3D), committed on release
//   wheel       zoom
//   Space       play / pause
//   Left/Right  step one frame while paused
//   R           reset the camera
class Input {
public:
    static void init(GLFWwindow* _window);
    // Samples buttons and keys; call once per frame after glfwPollEvents()
    static void update();
    // Feeds this frame's input to the camera and frame cursor. Input that ImGui
    // wants for itself is not forwarded.
    static void apply(Session& session);

    static bool isKeyJustPressed(int key);
    static bool isMouseButtonPressed(int button);
    static bool isMouseJustPressed(int button);
    static glm::vec2 getMousePosition(bool flip_y = true);
    static bool hasScrollInput();
};
