#pragma once
#include <vector>
#include <glm/glm.hpp>
#include "../../../core/config.h"

// One frame's worth of input for the bond mesh
struct BondFrameInput
{
    const float* positions = nullptr;   // Reference geometry, current frame, `dimension` floats per particle
    int particleCount = 0;              // Particles in the reference geometry
    const float* neighbors = nullptr;   // count x maxNeighbors indices stored as floats
    int count = 0;
    int maxNeighbors = 0;
    int dimension = 3;
    glm::vec3 boxExtent{ 0.0f };
    float diameter = config::DEFAULT_BOND_DIAMETER;
};

// Rebuilds bond geometry from live positions every frame.
//
// Particle i is bonded to n = round(neighbors[i, j]) for each slot j. A bond is
// emitted only when n < i, which skips unused and self slots (marked >= i) and
// draws every undirected bond exactly once. Bonds whose endpoints are more than
// half a box apart on any axis are treated as periodic wrap-around and skipped.
//
// In 3D a bond is a cylinder of `segments` flat sides; in 2D it is a quad of
// width `diameter`. Each side is two triangles (6 vertices) sharing one normal.
// Vertices and normals are always three floats.
class BondMeshBuilder
{
public:
    BondMeshBuilder(int count, int maxNeighbors, int segments = config::BOND_SEGMENTS);

    // Returns the number of vertices written this frame
    int rebuild(const BondFrameInput& input);

    const std::vector<float>& getVertices() const { return vertices; }
    const std::vector<float>& getNormals() const { return normals; }
    int getVertexCount() const { return vertexCount; }
    int getBondCount() const { return bondCount; }
    int getWrapRejectedCount() const { return wrapRejectedCount; }
    // Worst case: every slot of every particle holds a bond
    size_t getVertexCapacity() const { return vertexCapacity; }

    static bool crossesPeriodicBoundary(const glm::vec3& a, const glm::vec3& b, const glm::vec3& boxExtent, int dimension);

private:
    void emitCylinder(const glm::vec3& a, const glm::vec3& b, float radius);
    void emitQuad(const glm::vec3& a, const glm::vec3& b, float halfWidth);
    void emitVertex(const glm::vec3& position, const glm::vec3& normal);

    int segments;
    size_t vertexCapacity;
    std::vector<float> vertices;
    std::vector<float> normals;
    int vertexCount = 0;
    int bondCount = 0;
    int wrapRejectedCount = 0;
};
