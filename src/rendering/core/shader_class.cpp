#include "shader_class.h"
#include <fstream>
#include <iostream>
#include <glm/gtc/type_ptr.hpp>

// Reads a text file and outputs a string with everything in the text file
std::string get_file_contents(const char* filename)
{
    // Try a set of common base path prefixes to be resilient to working directory
    // differences (e.g., running from build/ vs project root)
    const char* prefixes[] = { "", "../", "../../", "../../../" };

    for (const char* prefix : prefixes)
    {
        std::string candidatePath = std::string(prefix) + filename;
        std::ifstream file(candidatePath.c_str(), std::ios::binary);
        if (file)
        {
            std::string contents;
            file.seekg(0, std::ios::end);
            contents.resize(static_cast<size_t>(file.tellg()));
            file.seekg(0, std::ios::beg);
            file.read(&contents[0], contents.size());
            file.close();
            return contents;
        }
    }

    // If this point is reached, then the file could not be opened
    std::cout << "ERROR::SHADER::FILE_NOT_FOUND: " << filename << "\n";
    throw ShaderBuildError(std::string("shader file not found: ") + filename);
}

namespace
{
	GLuint compileStage(GLenum stage, const char* file, const char* stageName)
	{
		std::string code = get_file_contents(file);
		const char* source = code.c_str();

		GLuint shader = glCreateShader(stage);
		glShaderSource(shader, 1, &source, NULL);
		glCompileShader(shader);

		int success;
		glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
		if (!success)
		{
			char infoLog[512];
			glGetShaderInfoLog(shader, 512, NULL, infoLog);
			std::cout << "ERROR::SHADER::" << stageName << "::COMPILATION_FAILED\n" << infoLog << "\n";
			glDeleteShader(shader);
			throw ShaderBuildError(std::string(file) + ": " + infoLog);
		}
		return shader;
	}
}

// Constructor that build the Shader Program from a vertex and fragment shader
Shader::Shader(const char* vertexFile, const char* fragmentFile)
{
	GLuint vertexShader = compileStage(GL_VERTEX_SHADER, vertexFile, "VERTEX");
	GLuint fragmentShader = 0;
	try
	{
		fragmentShader = compileStage(GL_FRAGMENT_SHADER, fragmentFile, "FRAGMENT");
	}
	catch (const ShaderBuildError&)
	{
		glDeleteShader(vertexShader);
		throw;
	}

	// Create Shader Program Object and get its reference
	ID = glCreateProgram();
	glAttachShader(ID, vertexShader);
	glAttachShader(ID, fragmentShader);
	glLinkProgram(ID);

	// destroy the now useless Vertex and Fragment Shader objects
	glDeleteShader(vertexShader);
	glDeleteShader(fragmentShader);

	int success;
	glGetProgramiv(ID, GL_LINK_STATUS, &success);
	if (!success)
	{
		char infoLog[512];
		glGetProgramInfoLog(ID, 512, NULL, infoLog);
		std::cout << "ERROR::SHADER::PROGRAM::LINKING_FAILED\n" << infoLog << "\n";
		destroy();
		throw ShaderBuildError(std::string(vertexFile) + " + " + fragmentFile + ": " + infoLog);
	}
}

Shader::~Shader()
{
	destroy();
}

// Activates the Shader Program
void Shader::use() const
{
	glUseProgram(ID);
}

// Deletes the Shader Program
void Shader::destroy()
{
	if (ID) glDeleteProgram(ID);
	ID = 0;
}

// utility uniform functions

void Shader::setBool(const std::string& name, bool value) const
{
	int location = glGetUniformLocation(ID, name.c_str());
	glUniform1i(location, value ? 1 : 0);
}

void Shader::setInt(const std::string& name, int value) const
{
	int location = glGetUniformLocation(ID, name.c_str());
	glUniform1i(location, value);
}

void Shader::setFloat(const std::string& name, float value) const
{
	int location = glGetUniformLocation(ID, name.c_str());
	glUniform1f(location, value);
}

void Shader::setVec2(const std::string& name, glm::vec2 vector) const
{
	int location = glGetUniformLocation(ID, name.c_str());
	glUniform2f(location, vector.x, vector.y);
}

void Shader::setVec3(const std::string& name, glm::vec3 vector) const
{
	int location = glGetUniformLocation(ID, name.c_str());
	glUniform3f(location, vector.x, vector.y, vector.z);
}

void Shader::setMat4(const std::string& name, const glm::mat4& matrix) const
{
	int location = glGetUniformLocation(ID, name.c_str());
	glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(matrix));
}

GLint Shader::attributeLocation(const char* name) const
{
	return glGetAttribLocation(ID, name);
}
