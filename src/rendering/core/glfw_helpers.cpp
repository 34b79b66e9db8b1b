#include "glfw_helpers.h"
#include <cstdlib>
#include <iostream>
#include "../../core/config.h"

void initGLFW()
{
    glfwSetErrorCallback([](int code, const char* description) {
        std::cerr << "ERROR::GLFW (" << code << "): " << description << "\n";
    });

    if (!glfwInit())
    {
        std::cerr << "Failed to initialize GLFW\n";
        exit(EXIT_FAILURE);
    }

#ifndef NDEBUG // Debug builds ask for a debug context
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GL_TRUE);
#endif

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, config::OPENGL_VERSION_MAJOR);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, config::OPENGL_VERSION_MINOR);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif
}

void setupGLFWDebugFlags()
{
#ifndef NDEBUG
    // KHR_debug is core only from 4.3; on a 3.3 context it depends on the driver
    if (!GLAD_GL_KHR_debug)
        return;

    int flags;
    glGetIntegerv(GL_CONTEXT_FLAGS, &flags);
    if (flags & GL_CONTEXT_FLAG_DEBUG_BIT)
    {
        glEnable(GL_DEBUG_OUTPUT);
        glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
        glDebugMessageCallback(glDebugOutput, nullptr);
        glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DONT_CARE, 0, nullptr, GL_TRUE);
    }
#endif
}

GLFWwindow* createWindow()
{
    GLFWwindow* window = glfwCreateWindow(config::INITIAL_WINDOW_WIDTH, config::INITIAL_WINDOW_HEIGHT, config::APPLICATION_NAME, NULL, NULL);
    if (window == NULL)
    {
        std::cerr << "Failed to create GLFW window\n";
        glfwTerminate();
        exit(EXIT_FAILURE);
    }
    glfwMakeContextCurrent(window);

    // The trajectory advances one frame per swap, so the refresh rate is the playback rate
    glfwSwapInterval(config::VSYNC ? 1 : 0);

    glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);

    return window;
}

void framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    glViewport(0, 0, width, height);
}

void APIENTRY glDebugOutput(GLenum source,
                            GLenum type,
                            unsigned int id,
                            GLenum severity,
                            GLsizei length,
                            const char* message,
                            const void* userParam)
{
    // ignore non-significant error/warning codes
    if (id == 131169 || id == 131185 || id == 131218 || id == 131204)
        return;
    if (severity == GL_DEBUG_SEVERITY_NOTIFICATION)
        return;

    const char* sourceName = "Other";
    switch (source)
    {
    case GL_DEBUG_SOURCE_API: sourceName = "API"; break;
    case GL_DEBUG_SOURCE_WINDOW_SYSTEM: sourceName = "Window System"; break;
    case GL_DEBUG_SOURCE_SHADER_COMPILER: sourceName = "Shader Compiler"; break;
    case GL_DEBUG_SOURCE_THIRD_PARTY: sourceName = "Third Party"; break;
    case GL_DEBUG_SOURCE_APPLICATION: sourceName = "Application"; break;
    }

    const char* typeName = "Other";
    switch (type)
    {
    case GL_DEBUG_TYPE_ERROR: typeName = "Error"; break;
    case GL_DEBUG_TYPE_DEPRECATED_BEHAVIOR: typeName = "Deprecated Behaviour"; break;
    case GL_DEBUG_TYPE_UNDEFINED_BEHAVIOR: typeName = "Undefined Behaviour"; break;
    case GL_DEBUG_TYPE_PORTABILITY: typeName = "Portability"; break;
    case GL_DEBUG_TYPE_PERFORMANCE: typeName = "Performance"; break;
    }

    const char* severityName = "low";
    switch (severity)
    {
    case GL_DEBUG_SEVERITY_HIGH: severityName = "high"; break;
    case GL_DEBUG_SEVERITY_MEDIUM: severityName = "medium"; break;
    }

    std::cerr << "GL debug (" << id << ", " << sourceName << ", " << typeName << ", " << severityName << "): " << message << "\n";
}
