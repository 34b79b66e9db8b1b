#include "glad_helpers.h"
#include <cstdlib>
#include <iostream>

void initGLAD(GLFWwindow* window)
{
	int version = gladLoadGL(glfwGetProcAddress);
	if (!version) {
		std::cerr << "Failed to initialize GLAD\n";
		glfwTerminate();
		exit(EXIT_FAILURE);
	}
	std::cout << "GL " << GLAD_VERSION_MAJOR(version) << "." << GLAD_VERSION_MINOR(version) << "\n";

	int display_w, display_h;
	glfwGetFramebufferSize(window, &display_w, &display_h);
	glViewport(0, 0, display_w, display_h);

	// Depth testing is switched per frame by the renderer (3D only).
	// Bond cylinders and disks are seen from both sides, so nothing is culled.
	glDepthFunc(GL_LESS);
	glDisable(GL_CULL_FACE);
	glEnable(GL_BLEND);
	glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
}
