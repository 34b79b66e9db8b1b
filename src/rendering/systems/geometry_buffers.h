#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <glad/glad.h>
#include "../core/mesh/bond_mesh_builder.h"
#include "../core/mesh/shape_mesh.h"

struct Session;
struct Geometry;

// GPU copy of a shape's base mesh, shared by every geometry of that shape
struct MeshBuffers
{
    ShapeMesh mesh;
    GLuint positionBuffer{};
    GLuint normalBuffer{};
};

struct GeometryGpuBuffers
{
    std::string name;
    GLuint VAO{};
    std::map<std::string, GLuint> fieldBuffers;     // One per non-Global field
    const MeshBuffers* mesh = nullptr;              // Disk and Sphere

    // Bond only, sized for count x maxNeighbors bonds
    GLuint bondVertexBuffer{};
    GLuint bondNormalBuffer{};
    std::unique_ptr<BondMeshBuilder> bondBuilder;

    bool drawable = false;
};

// GPU half of the geometry registry. Built once, after loading has completed.
class GeometryBuffers
{
public:
    GeometryBuffers() = default;
    ~GeometryBuffers();

    GeometryBuffers(const GeometryBuffers&) = delete;
    GeometryBuffers& operator=(const GeometryBuffers&) = delete;

    // Allocates buffers for every geometry in the session. Problems that keep a
    // geometry from being drawn are reported to the session log.
    void create(Session& session);
    void cleanup();

    bool isCreated() const { return created; }
    GeometryGpuBuffers* find(const std::string& name);
    std::vector<GeometryGpuBuffers>& getGeometries() { return geometries; }

private:
    const MeshBuffers* meshFor(ShapeKind shape, int dimension, Session& session);
    void createFieldBuffers(const Geometry& geometry, GeometryGpuBuffers& gpu);
    void createBondBuffers(const Geometry& geometry, GeometryGpuBuffers& gpu, Session& session);

    std::map<ShapeKind, std::unique_ptr<MeshBuffers>> meshes;
    std::vector<GeometryGpuBuffers> geometries;
    bool created = false;
};
