#pragma once
#include <glm/glm.hpp>

namespace config
{
	// Application Configuration
	// This namespace contains all configuration constants, default values,
	// and "magic numbers" used throughout the application.

	// ========== Window and OpenGL Configuration ==========
	constexpr int INITIAL_WINDOW_WIDTH{800};
	constexpr int INITIAL_WINDOW_HEIGHT{600};
	constexpr int OPENGL_VERSION_MAJOR{3};
	constexpr int OPENGL_VERSION_MINOR{3};
	constexpr const char* GLSL_VERSION{"#version 330"};
	constexpr const char* APPLICATION_NAME{"Trajview"};
	constexpr bool VSYNC{ true };	// The frame loop advances one trajectory frame per refresh

	// ========== Streaming Configuration ==========
	constexpr int DEFAULT_CHUNK_SIZE{ 128 };	// Frames per GetArrayChunk request when the host does not say
	constexpr int DEFAULT_SIMULATION_INDEX{ 0 };

	// ========== Mesh Configuration ==========
	constexpr int DISK_SEGMENTS{ 16 };
	constexpr float DISK_RADIUS{ 0.5f };		// Unit diameter, scaled per instance by size
	constexpr int SPHERE_H_SEGMENTS{ 16 };
	constexpr int SPHERE_V_SEGMENTS{ 8 };
	constexpr float SPHERE_RADIUS{ 0.5f };
	constexpr int BOND_SEGMENTS{ 3 };			// Circular segments per bond cylinder
	constexpr int VERTICES_PER_QUAD{ 6 };

	// ========== Attribute Defaults ==========
	// Used when a geometry does not carry the field at all
	constexpr float DEFAULT_SIZE{ 1.0f };
	constexpr glm::vec3 DEFAULT_COLOR{ 0.2f, 0.45f, 0.85f };
	constexpr float DEFAULT_ANGLE{ 0.0f };
	constexpr float DEFAULT_BOND_DIAMETER{ 0.2f };
	constexpr glm::vec3 DEFAULT_BOND_COLOR{ 0.8f, 0.8f, 0.8f };
	constexpr glm::vec3 DEFAULT_BACKGROUND_COLOR{ 0.08f, 0.08f, 0.1f };

	// ========== Camera Configuration ==========
	constexpr float ZOOM_FACTOR{ 1.1f };			// Multiplicative step per wheel notch
	constexpr float ORBIT_SENSITIVITY{ 0.01f };		// Radians per dragged pixel
	constexpr float PITCH_LIMIT{ 1.57079632679f / 1.05f };
	constexpr float CAMERA_FOV_DEGREES{ 45.0f };
	constexpr float CAMERA_NEAR_PLANE{ 0.01f };
	constexpr float INITIAL_DISTANCE_SCALE{ 1.5f };	// Orbit distance as a multiple of the box diagonal
	constexpr float INITIAL_HALF_EXTENT_SCALE{ 0.55f };	// 2D visible half-extent as a multiple of the box size
	constexpr glm::vec3 WORLD_UP{ 0.0f, 1.0f, 0.0f };
	constexpr glm::vec3 LIGHT_DIRECTION{ 0.5f, 0.7f, 1.0f };

	// ========== Shader Paths ==========
	constexpr const char* PARTICLE_VERTEX_SHADER{ "shaders/particle.vert" };
	constexpr const char* PARTICLE_FRAGMENT_SHADER{ "shaders/particle.frag" };
	constexpr const char* BOND_VERTEX_SHADER{ "shaders/bond.vert" };
	constexpr const char* BOND_FRAGMENT_SHADER{ "shaders/bond.frag" };

	// ========== Runtime Configuration Variables ==========
	// These can be modified at runtime
	inline bool showPerformanceWindow{ true };
	inline bool showDiagnosticsWindow{ true };
	inline bool startPlaying{ true };
}
