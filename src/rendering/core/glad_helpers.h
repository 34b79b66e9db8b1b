#pragma once
#include <glad/glad.h>
#include <GLFW/glfw3.h>

// Loads the GL entry points for the current context. Exits when that fails.
void initGLAD(GLFWwindow* window);
