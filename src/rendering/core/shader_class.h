#pragma once

#include <glad/glad.h>
#include <stdexcept>
#include <string>
#include <glm/glm.hpp>

// Compile or link failure. Fatal for the renderer.
class ShaderBuildError : public std::runtime_error
{
public:
	explicit ShaderBuildError(const std::string& what) : std::runtime_error(what) {}
};

std::string get_file_contents(const char* filename);

class Shader
{
public:
	// Reference ID of the Shader Program
	GLuint ID = 0;
	// Constructor that build the Shader Program from 2 different shaders.
	// Throws ShaderBuildError when a file is missing or compilation/linking fails.
	Shader(const char* vertexFile, const char* fragmentFile);
	~Shader();

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;

	// Activates the Shader Program
	void use() const;
	// Deletes the Shader Program
	void destroy();

	// utility uniform functions
	void setBool(const std::string& name, bool value) const;
	void setInt(const std::string& name, int value) const;
	void setFloat(const std::string& name, float value) const;
	void setVec2(const std::string& name, glm::vec2 vector) const;
	void setVec3(const std::string& name, glm::vec3 vector) const;
	void setMat4(const std::string& name, const glm::mat4& matrix) const;
	GLint attributeLocation(const char* name) const;
};
