#include "trajectory_renderer.h"
#include <iostream>
#include "../core/shader_class.h"
#include "../../core/config.h"
#include "../../core/session.h"
#include "../../utils/timer.h"

namespace
{
    enum AttributeLocation : GLuint
    {
        VERTEX_POSITION = 0,
        VERTEX_NORMAL = 1,
        INSTANCE_POSITION = 2,
        INSTANCE_SIZE = 3,
        INSTANCE_COLOR = 4,
        INSTANCE_ANGLE = 5,
    };

    void setFallbackUniform(const Shader& shader, const std::string& name, int components, const glm::vec3& value)
    {
        switch (components)
        {
            case 1: shader.setFloat(name, value.x); break;
            case 2: shader.setVec2(name, glm::vec2(value)); break;
            default: shader.setVec3(name, value); break;
        }
    }

    // First value of a field, or the fallback when the geometry lacks it
    glm::vec3 constantValue(const Geometry& geometry, const char* fieldName, const glm::vec3& fallback)
    {
        const FieldBuffer* buffer = geometry.findField(fieldName);
        glm::vec3 value = fallback;
        if (buffer)
        {
            for (int k = 0; k < buffer->components && k < 3 && k < static_cast<int>(buffer->data.size()); ++k)
                value[k] = buffer->data[static_cast<size_t>(k)];
        }
        return value;
    }
}

TrajectoryRenderer::TrajectoryRenderer()
    : bondUpload(std::make_unique<FullReuploadStrategy>())
{
}

TrajectoryRenderer::~TrajectoryRenderer()
{
    cleanup();
}

void TrajectoryRenderer::initialize()
{
    if (initialized) return;

    std::cout << "TrajectoryRenderer: Loading shaders..." << std::endl;
    particleShader = std::make_unique<Shader>(config::PARTICLE_VERTEX_SHADER, config::PARTICLE_FRAGMENT_SHADER);
    bondShader = std::make_unique<Shader>(config::BOND_VERTEX_SHADER, config::BOND_FRAGMENT_SHADER);
    std::cout << "TrajectoryRenderer: Initialized (bond upload: " << bondUpload->name() << ")" << std::endl;
    initialized = true;
}

void TrajectoryRenderer::cleanup()
{
    buffers.cleanup();
    particleShader.reset();
    bondShader.reset();
    initialized = false;
}

void TrajectoryRenderer::setBondUploadStrategy(std::unique_ptr<BondUploadStrategy> strategy)
{
    if (strategy)
        bondUpload = std::move(strategy);
}

void TrajectoryRenderer::renderFrame(Session& session, int width, int height)
{
    TimerCPU timer("Render Frame");
    stats.reset();

    glViewport(0, 0, width, height);
    glClearColor(session.backgroundColor.r, session.backgroundColor.g, session.backgroundColor.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    // Nothing to draw until the loader is done; the next tick will look again
    if (!initialized || !session.loaded)
        return;

    if (!buffers.isCreated())
        buffers.create(session);

    session.camera.setViewport(width, height);
    view = session.camera.getViewMatrix();
    projection = session.camera.getProjectionMatrix();

    // 2D geometry all lies at z = 0, so draw order decides visibility
    if (session.getDimension() == 3)
        glEnable(GL_DEPTH_TEST);
    else
        glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);

    session.cursor.wrap(session.getFrameCount());
    const int frame = session.cursor.getCurrentFrame();

    for (const Geometry& geometry : session.registry.geometries())
    {
        GeometryGpuBuffers* gpu = buffers.find(geometry.descriptor.name);
        if (!gpu || !gpu->drawable)
            continue;

        switch (geometry.descriptor.shape)
        {
            case ShapeKind::Disk:
            case ShapeKind::Sphere:
                drawParticles(session, geometry, *gpu, frame);
                break;
            case ShapeKind::Bond:
                drawBonds(session, geometry, *gpu, frame);
                break;
        }
    }
    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    session.cursor.advance();
}

void TrajectoryRenderer::drawParticles(Session& session, const Geometry& geometry, GeometryGpuBuffers& gpu, int frame)
{
    const MeshBuffers& mesh = *gpu.mesh;

    particleShader->use();
    particleShader->setMat4("uView", view);
    particleShader->setMat4("uProjection", projection);
    particleShader->setInt("uDimension", session.getDimension());
    particleShader->setBool("uHasNormals", mesh.mesh.hasNormals());
    particleShader->setBool("uLit", mesh.mesh.hasNormals());
    particleShader->setVec3("uLightDir", config::LIGHT_DIRECTION);

    glBindVertexArray(gpu.VAO);
    bindMesh(mesh);

    if (!bindFieldBuffer(geometry, gpu, field::POSITION, INSTANCE_POSITION, frame))
    {
        glBindVertexArray(0);
        return;
    }
    bindInstanceAttribute(geometry, gpu, field::SIZE, INSTANCE_SIZE, frame, "Size", 1, glm::vec3(config::DEFAULT_SIZE));
    bindInstanceAttribute(geometry, gpu, field::COLOR, INSTANCE_COLOR, frame, "Color", 3, config::DEFAULT_COLOR);
    bindInstanceAttribute(geometry, gpu, field::ANGLE, INSTANCE_ANGLE, frame, "Angle", 2, glm::vec3(config::DEFAULT_ANGLE));

    glDrawArraysInstanced(GL_TRIANGLES, 0, mesh.mesh.vertexCount, geometry.descriptor.count);
    glBindVertexArray(0);

    stats.drawCalls++;
    stats.instancesDrawn += geometry.descriptor.count;
}

void TrajectoryRenderer::drawBonds(Session& session, const Geometry& geometry, GeometryGpuBuffers& gpu, int frame)
{
    const GeometryDescriptor& descriptor = geometry.descriptor;
    const Geometry* reference = session.registry.find(*descriptor.referenceGeometry);
    const FieldBuffer* positions = reference ? reference->findField(field::POSITION) : nullptr;
    const FieldBuffer* neighbors = geometry.findField(field::NEIGHBOR_INDEX);
    if (!positions || !neighbors)
        return;

    BondFrameInput input;
    input.positions = positions->frameSlice(frame, reference->descriptor.count);
    input.particleCount = reference->descriptor.count;
    input.neighbors = neighbors->frameSlice(frame, descriptor.count);
    input.count = descriptor.count;
    input.maxNeighbors = descriptor.maxNeighbors;
    input.dimension = session.getDimension();
    input.boxExtent = session.metadata->boxExtent();
    input.diameter = constantValue(geometry, field::DIAMETER, glm::vec3(config::DEFAULT_BOND_DIAMETER)).x;

    int vertexCount = 0;
    {
        TimerCPU rebuildTimer("Bond Mesh Rebuild");
        vertexCount = gpu.bondBuilder->rebuild(input);
        bondUpload->upload(gpu.bondVertexBuffer, gpu.bondNormalBuffer, *gpu.bondBuilder);
    }

    stats.bondsDrawn += gpu.bondBuilder->getBondCount();
    stats.bondsWrapRejected += gpu.bondBuilder->getWrapRejectedCount();
    stats.bondVertices += vertexCount;
    if (vertexCount == 0)
        return;

    bondShader->use();
    bondShader->setMat4("uView", view);
    bondShader->setMat4("uProjection", projection);
    bondShader->setVec3("uColor", constantValue(geometry, field::COLOR, config::DEFAULT_BOND_COLOR));
    bondShader->setBool("uLit", session.getDimension() == 3);
    bondShader->setVec3("uLightDir", config::LIGHT_DIRECTION);

    // The draw covers only what was written this frame, not the buffer capacity
    glBindVertexArray(gpu.VAO);
    glDrawArrays(GL_TRIANGLES, 0, vertexCount);
    glBindVertexArray(0);
    stats.drawCalls++;
}

void TrajectoryRenderer::bindMesh(const MeshBuffers& mesh)
{
    glBindBuffer(GL_ARRAY_BUFFER, mesh.positionBuffer);
    glEnableVertexAttribArray(VERTEX_POSITION);
    glVertexAttribPointer(VERTEX_POSITION, mesh.mesh.components, GL_FLOAT, GL_FALSE, 0, (void*)0);
    glVertexAttribDivisor(VERTEX_POSITION, 0);

    if (mesh.mesh.hasNormals())
    {
        glBindBuffer(GL_ARRAY_BUFFER, mesh.normalBuffer);
        glEnableVertexAttribArray(VERTEX_NORMAL);
        glVertexAttribPointer(VERTEX_NORMAL, 3, GL_FLOAT, GL_FALSE, 0, (void*)0);
        glVertexAttribDivisor(VERTEX_NORMAL, 0);
    }
    else
    {
        glDisableVertexAttribArray(VERTEX_NORMAL);
    }
}

bool TrajectoryRenderer::bindFieldBuffer(const Geometry& geometry, GeometryGpuBuffers& gpu, const char* fieldName, GLuint location, int frame)
{
    const FieldBuffer* buffer = geometry.findField(fieldName);
    auto it = gpu.fieldBuffers.find(fieldName);
    if (!buffer || it == gpu.fieldBuffers.end())
        return false;

    glBindBuffer(GL_ARRAY_BUFFER, it->second);
    if (buffer->storage == StorageClass::Dynamic)
    {
        size_t floats = buffer->frameLength(geometry.descriptor.count);
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(floats * sizeof(float)),
                        buffer->frameSlice(frame, geometry.descriptor.count));
    }
    glEnableVertexAttribArray(location);
    glVertexAttribPointer(location, buffer->components, GL_FLOAT, GL_FALSE, 0, (void*)0);
    glVertexAttribDivisor(location, 1);
    return true;
}

void TrajectoryRenderer::bindInstanceAttribute(const Geometry& geometry, GeometryGpuBuffers& gpu, const char* fieldName, GLuint location,
                                               int frame, const std::string& uniformName, int uniformComponents, const glm::vec3& defaultValue)
{
    const std::string flag = "u" + uniformName + "IsAttribute";
    const FieldBuffer* buffer = geometry.findField(fieldName);

    if (buffer && buffer->storage != StorageClass::Global && bindFieldBuffer(geometry, gpu, fieldName, location, frame))
    {
        particleShader->setBool(flag, true);
        return;
    }

    // Missing field: default value. Global field: its constant.
    glDisableVertexAttribArray(location);
    particleShader->setBool(flag, false);
    setFallbackUniform(*particleShader, "u" + uniformName, uniformComponents, constantValue(geometry, fieldName, defaultValue));
}
