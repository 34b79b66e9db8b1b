#pragma once
#include <memory>
#include <string>
#include <glad/glad.h>
#include <glm/glm.hpp>
#include "bond_upload_strategy.h"
#include "geometry_buffers.h"

class Shader;
struct Session;
struct Geometry;

struct RenderStats
{
    int drawCalls = 0;
    int instancesDrawn = 0;
    int bondsDrawn = 0;
    int bondVertices = 0;
    int bondsWrapRejected = 0;

    void reset() { *this = RenderStats{}; }
};

// Per-tick draw pipeline: clear, update camera uniforms, wrap the frame cursor,
// draw every geometry for the current frame, then advance when playing.
class TrajectoryRenderer
{
public:
    TrajectoryRenderer();
    ~TrajectoryRenderer();

    // Compiles the shaders. Throws ShaderBuildError.
    void initialize();
    void cleanup();

    void renderFrame(Session& session, int width, int height);

    void setBondUploadStrategy(std::unique_ptr<BondUploadStrategy> strategy);
    const RenderStats& getStats() const { return stats; }

private:
    void drawParticles(Session& session, const Geometry& geometry, GeometryGpuBuffers& gpu, int frame);
    void drawBonds(Session& session, const Geometry& geometry, GeometryGpuBuffers& gpu, int frame);

    // Binds one per-instance field at `location`, or sets the uniform fallback
    // when the field is missing or Global
    void bindInstanceAttribute(const Geometry& geometry, GeometryGpuBuffers& gpu, const char* fieldName, GLuint location,
                               int frame, const std::string& uniformName, int uniformComponents, const glm::vec3& defaultValue);
    // Points `location` at the field's vertex buffer, refreshing it with the
    // current frame first when the field is Dynamic
    bool bindFieldBuffer(const Geometry& geometry, GeometryGpuBuffers& gpu, const char* fieldName, GLuint location, int frame);
    void bindMesh(const MeshBuffers& mesh);

    std::unique_ptr<Shader> particleShader;
    std::unique_ptr<Shader> bondShader;
    std::unique_ptr<BondUploadStrategy> bondUpload;
    GeometryBuffers buffers;
    glm::mat4 view{ 1.0f };
    glm::mat4 projection{ 1.0f };
    RenderStats stats;
    bool initialized{ false };
};
