#include "geometry_buffers.h"
#include <iostream>
#include "../../core/session.h"

namespace
{
    GLuint createArrayBuffer(const std::vector<float>& data, GLenum usage)
    {
        GLuint buffer{};
        glGenBuffers(1, &buffer);
        glBindBuffer(GL_ARRAY_BUFFER, buffer);
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(data.size() * sizeof(float)),
                     data.empty() ? nullptr : data.data(), usage);
        return buffer;
    }

    GLuint createEmptyArrayBuffer(size_t floats, GLenum usage)
    {
        GLuint buffer{};
        glGenBuffers(1, &buffer);
        glBindBuffer(GL_ARRAY_BUFFER, buffer);
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(floats * sizeof(float)), nullptr, usage);
        return buffer;
    }

    void deleteBuffer(GLuint& buffer)
    {
        if (buffer != 0)
        {
            glDeleteBuffers(1, &buffer);
            buffer = 0;
        }
    }
}

GeometryBuffers::~GeometryBuffers()
{
    cleanup();
}

void GeometryBuffers::create(Session& session)
{
    if (created || !session.metadata)
        return;

    const int dimension = session.metadata->dimension;
    for (const Geometry& geometry : session.registry.geometries())
    {
        GeometryGpuBuffers gpu;
        gpu.name = geometry.descriptor.name;
        glGenVertexArrays(1, &gpu.VAO);

        createFieldBuffers(geometry, gpu);

        switch (geometry.descriptor.shape)
        {
            case ShapeKind::Disk:
            case ShapeKind::Sphere:
                gpu.mesh = meshFor(geometry.descriptor.shape, dimension, session);
                gpu.drawable = gpu.mesh != nullptr;
                if (!geometry.hasField(field::POSITION))
                {
                    session.log.report(ErrorKind::MissingField, "geometry '" + gpu.name + "' has no position field and is not drawn");
                    gpu.drawable = false;
                }
                break;
            case ShapeKind::Bond:
                createBondBuffers(geometry, gpu, session);
                break;
        }

        std::cout << "GeometryBuffers: '" << gpu.name << "' " << gpu.fieldBuffers.size() << " field buffers"
                  << (gpu.drawable ? "" : " (not drawable)") << "\n";
        geometries.push_back(std::move(gpu));
    }
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    created = true;
}

void GeometryBuffers::createFieldBuffers(const Geometry& geometry, GeometryGpuBuffers& gpu)
{
    for (const auto& [fieldName, buffer] : geometry.fields)
    {
        if (!geometry.needsVertexBuffer(fieldName))
            continue;

        switch (buffer.storage)
        {
            case StorageClass::Static:
                gpu.fieldBuffers[fieldName] = createArrayBuffer(buffer.data, GL_STATIC_DRAW);
                break;
            case StorageClass::Dynamic:
                // Holds a single frame; refilled from the CPU copy whenever the field is bound
                gpu.fieldBuffers[fieldName] = createEmptyArrayBuffer(buffer.frameLength(geometry.descriptor.count), GL_STREAM_DRAW);
                break;
            case StorageClass::Global:
                break;
        }
    }
}

void GeometryBuffers::createBondBuffers(const Geometry& geometry, GeometryGpuBuffers& gpu, Session& session)
{
    const GeometryDescriptor& descriptor = geometry.descriptor;
    if (!geometry.hasField(field::NEIGHBOR_INDEX))
    {
        session.log.report(ErrorKind::MissingField, "bond geometry '" + gpu.name + "' has no neighbor_idx field and is not drawn");
        return;
    }
    const Geometry* reference = descriptor.referenceGeometry ? session.registry.find(*descriptor.referenceGeometry) : nullptr;
    if (!reference || !reference->hasField(field::POSITION))
    {
        session.log.report(ErrorKind::MissingField, "bond geometry '" + gpu.name + "' references '" +
                           descriptor.referenceGeometry.value_or("") + "', which has no positions");
        return;
    }

    gpu.bondBuilder = std::make_unique<BondMeshBuilder>(descriptor.count, descriptor.maxNeighbors);
    size_t capacityFloats = gpu.bondBuilder->getVertexCapacity() * 3;
    gpu.bondVertexBuffer = createEmptyArrayBuffer(capacityFloats, GL_DYNAMIC_DRAW);
    gpu.bondNormalBuffer = createEmptyArrayBuffer(capacityFloats, GL_DYNAMIC_DRAW);

    glBindVertexArray(gpu.VAO);
    glBindBuffer(GL_ARRAY_BUFFER, gpu.bondVertexBuffer);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), (void*)0);
    glBindBuffer(GL_ARRAY_BUFFER, gpu.bondNormalBuffer);
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), (void*)0);
    glBindVertexArray(0);

    gpu.drawable = true;
}

const MeshBuffers* GeometryBuffers::meshFor(ShapeKind shape, int dimension, Session& session)
{
    auto it = meshes.find(shape);
    if (it != meshes.end())
        return it->second.get();

    std::optional<ShapeMesh> mesh = buildBaseMesh(shape, dimension, session.log);
    if (!mesh)
    {
        // Remember the failure so it is reported once
        meshes[shape] = nullptr;
        return nullptr;
    }

    auto buffers = std::make_unique<MeshBuffers>();
    buffers->mesh = std::move(*mesh);
    buffers->positionBuffer = createArrayBuffer(buffers->mesh.positions, GL_STATIC_DRAW);
    if (buffers->mesh.hasNormals())
        buffers->normalBuffer = createArrayBuffer(buffers->mesh.normals, GL_STATIC_DRAW);

    std::cout << "GeometryBuffers: built " << shapeKindName(shape) << " mesh with " << buffers->mesh.vertexCount << " vertices\n";
    const MeshBuffers* result = buffers.get();
    meshes[shape] = std::move(buffers);
    return result;
}

GeometryGpuBuffers* GeometryBuffers::find(const std::string& name)
{
    for (GeometryGpuBuffers& gpu : geometries)
    {
        if (gpu.name == name)
            return &gpu;
    }
    return nullptr;
}

void GeometryBuffers::cleanup()
{
    for (GeometryGpuBuffers& gpu : geometries)
    {
        for (auto& [_, buffer] : gpu.fieldBuffers)
            deleteBuffer(buffer);
        deleteBuffer(gpu.bondVertexBuffer);
        deleteBuffer(gpu.bondNormalBuffer);
        if (gpu.VAO != 0)
        {
            glDeleteVertexArrays(1, &gpu.VAO);
            gpu.VAO = 0;
        }
    }
    geometries.clear();

    for (auto& [_, mesh] : meshes)
    {
        if (mesh)
        {
            deleteBuffer(mesh->positionBuffer);
            deleteBuffer(mesh->normalBuffer);
        }
    }
    meshes.clear();
    created = false;
}
