#pragma once
#include <glad/glad.h>
#include <GLFW/glfw3.h>

void initGLFW();
GLFWwindow* createWindow();
void setupGLFWDebugFlags();
void framebuffer_size_callback(GLFWwindow* window, int width, int height);
void APIENTRY glDebugOutput(GLenum source, GLenum type, unsigned int id, GLenum severity,
                            GLsizei length, const char* message, const void* userParam);
