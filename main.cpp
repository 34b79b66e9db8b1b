// Third-party includes
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <algorithm>
#include <thread>
#include <chrono>
#include <glad/glad.h>
#include <GLFW/glfw3.h>

// Core includes
#include "src/core/config.h"
#include "src/core/session.h"

// Host includes
#include "src/host/host_client.h"
#include "src/host/pipe_host_transport.h"
#include "src/loading/chunked_loader.h"

// Rendering includes
#include "src/rendering/core/shader_class.h"
#include "src/rendering/core/glad_helpers.h"
#include "src/rendering/core/glfw_helpers.h"
#include "src/rendering/systems/trajectory_renderer.h"

// UI includes
#include "src/ui/ui_manager.h"

// Input includes
#include "src/input/input.h"

// Utility includes
#include "src/utils/timer.h"

// Simple OpenGL error checking function
void checkGLError(const char *operation)
{
	GLenum error = glGetError();
	if (error != GL_NO_ERROR)
	{
		std::cerr << "OpenGL error after " << operation << ": " << error << "\n";
	}
}

// Window state management
struct WindowState {
	bool wasMinimized = false;
	int lastKnownWidth = 0;
	int lastKnownHeight = 0;
};

bool handleWindowStateTransitions(GLFWwindow* window, WindowState& state)
{
	int currentWidth, currentHeight;
	glfwGetFramebufferSize(window, &currentWidth, &currentHeight);
	bool isMinimized = (currentWidth == 0 || currentHeight == 0) || glfwGetWindowAttrib(window, GLFW_ICONIFIED);

	if (isMinimized && !state.wasMinimized)
	{
		std::cout << "Window minimized, suspending rendering\n";
		state.wasMinimized = true;
	}
	else if (!isMinimized && state.wasMinimized)
	{
		std::cout << "Window restored, resuming rendering\n";
		state.wasMinimized = false;
	}

	// The loader is still pumped by the caller; only drawing is skipped
	if (isMinimized)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(16));
		return true;
	}

	state.lastKnownWidth = currentWidth;
	state.lastKnownHeight = currentHeight;
	return false;
}

// Applies the output resolution the host asked for, once the metadata is known
void applyRequestedResolution(GLFWwindow* window, const Session& session)
{
	static bool applied = false;
	if (applied || !session.metadata)
		return;
	applied = true;

	if (session.metadata->resolution)
	{
		glm::ivec2 size = *session.metadata->resolution;
		if (size.x > 0 && size.y > 0)
		{
			std::cout << "Resizing window to " << size.x << "x" << size.y << "\n";
			glfwSetWindowSize(window, size.x, size.y);
		}
	}
}

void renderUI(UIManager& uiManager, Session& session, const ChunkedLoader* loader, PerformanceMonitor& perfMonitor,
			  const TrajectoryRenderer& renderer, bool rendererFailed)
{
	if (rendererFailed)
	{
		uiManager.renderFatalError(session.log);
		return;
	}

	uiManager.renderPlaybackControls(session, loader);
	uiManager.renderCameraControls(session);
	if (config::showDiagnosticsWindow)
		uiManager.renderDiagnostics(session.log);
	if (config::showPerformanceWindow)
		uiManager.renderPerformanceMonitor(perfMonitor, renderer.getStats());
}

// ImGui rendering
void renderImGui()
{
	ImGui::Render();
	ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
	checkGLError("ImGui_ImplOpenGL3_RenderDrawData");
}

int main(int argc, char** argv)
{
	if (argc < 2)
	{
		std::cerr << "Usage: " << argv[0] << " <host-command> [args...]\n";
		return EXIT_FAILURE;
	}
	std::vector<std::string> hostCommand(argv + 1, argv + argc);

	initGLFW();
	GLFWwindow *window = createWindow();
	initGLAD(window);
	setupGLFWDebugFlags();

	{ // This scope is used to ensure the opengl elements are destroyed before the opengl context

	// Initialize ImGui
	IMGUI_CHECKVERSION();
	ImGui::CreateContext();
	ImGui::StyleColorsDark();
	ImGui_ImplGlfw_InitForOpenGL(window, true);
	ImGui_ImplOpenGL3_Init(config::GLSL_VERSION);
	Input::init(window);

	Session session;
	session.cursor.setPlaying(config::startPlaying);

	// Host connection. Without one the window still opens and shows why nothing loads.
	std::unique_ptr<PipeHostTransport> transport;
	std::unique_ptr<HostClient> hostClient;
	std::unique_ptr<ChunkedLoader> loader;
	try
	{
		transport = std::make_unique<PipeHostTransport>(hostCommand);
		hostClient = std::make_unique<HostClient>(*transport);
		loader = std::make_unique<ChunkedLoader>(*hostClient, session);
		loader->start();
	}
	catch (const HostTransportError& e)
	{
		session.log.report(ErrorKind::HostFailure, e.what());
	}

	TrajectoryRenderer renderer;
	bool rendererFailed = false;
	try
	{
		renderer.initialize();
	}
	catch (const ShaderBuildError& e)
	{
		session.log.report(ErrorKind::ShaderBuildFailure, e.what());
		rendererFailed = true;
	}

	UIManager uiManager;
	PerformanceMonitor perfMonitor{};
	WindowState windowState;
	float lastFrame = static_cast<float>(glfwGetTime());

	// Main while loop
	while (!glfwWindowShouldClose(window))
	{
		float currentFrame = static_cast<float>(glfwGetTime());
		float deltaTime = currentFrame - lastFrame;
		lastFrame = currentFrame;

		glfwPollEvents();

		// Loading keeps going even while nothing is drawn
		if (loader)
		{
			TimerCPU loaderTimer("Loader Update");
			loader->update();
		}
		applyRequestedResolution(window, session);

		if (handleWindowStateTransitions(window, windowState))
			continue;
		uiManager.updatePerformanceMetrics(perfMonitor, deltaTime);

		int width = windowState.lastKnownWidth;
		int height = windowState.lastKnownHeight;

		ImGui_ImplOpenGL3_NewFrame();
		ImGui_ImplGlfw_NewFrame();
		ImGui::NewFrame();

		{
			TimerCPU inputTimer("Input Processing");
			Input::update();
			if (!rendererFailed)
				Input::apply(session);
		}

		if (rendererFailed)
		{
			glViewport(0, 0, width, height);
			glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
			glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
		}
		else
		{
			renderer.renderFrame(session, width, height);
			checkGLError("renderFrame");
		}

		// Update all the timers
		TimerManager::instance().finalizeFrame();
		renderUI(uiManager, session, loader.get(), perfMonitor, renderer, rendererFailed);
		renderImGui();
		TimerManager::instance().resetFrame();

		glfwSwapBuffers(window);
	}

	renderer.cleanup();
	std::cout << "Shutting down (" << session.log.size() << " problem(s) reported)\n";
	}
	// Shutdown ImGui
	ImGui_ImplOpenGL3_Shutdown();
	ImGui_ImplGlfw_Shutdown();
	ImGui::DestroyContext();
	glfwDestroyWindow(window);
	glfwTerminate();

	return EXIT_SUCCESS;
}
