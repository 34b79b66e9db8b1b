#include "bond_mesh_builder.h"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

BondMeshBuilder::BondMeshBuilder(int count, int maxNeighbors, int segments)
    : segments(std::max(segments, 1))
{
    size_t verticesPerBond = static_cast<size_t>(this->segments) * config::VERTICES_PER_QUAD;
    vertexCapacity = static_cast<size_t>(std::max(count, 0)) * static_cast<size_t>(std::max(maxNeighbors, 0)) * verticesPerBond;
    vertices.assign(vertexCapacity * 3, 0.0f);
    normals.assign(vertexCapacity * 3, 0.0f);
}

bool BondMeshBuilder::crossesPeriodicBoundary(const glm::vec3& a, const glm::vec3& b, const glm::vec3& boxExtent, int dimension)
{
    for (int axis = 0; axis < dimension; ++axis)
    {
        if (std::fabs(a[axis] - b[axis]) > 0.5f * boxExtent[axis])
            return true;
    }
    return false;
}

int BondMeshBuilder::rebuild(const BondFrameInput& input)
{
    vertexCount = 0;
    bondCount = 0;
    wrapRejectedCount = 0;
    if (!input.positions || !input.neighbors)
        return 0;

    auto positionOf = [&input](int index)
    {
        glm::vec3 p(0.0f);
        for (int k = 0; k < input.dimension; ++k)
            p[k] = input.positions[static_cast<size_t>(index) * input.dimension + k];
        return p;
    };

    float radius = 0.5f * input.diameter;
    int rows = std::min(input.count, input.particleCount);

    for (int i = 0; i < rows; ++i)
    {
        for (int j = 0; j < input.maxNeighbors; ++j)
        {
            int n = static_cast<int>(std::lround(input.neighbors[static_cast<size_t>(i) * input.maxNeighbors + j]));
            if (n >= i || n < 0)
                continue;

            glm::vec3 a = positionOf(i);
            glm::vec3 b = positionOf(n);
            if (crossesPeriodicBoundary(a, b, input.boxExtent, input.dimension))
            {
                ++wrapRejectedCount;
                continue;
            }
            if (static_cast<size_t>(vertexCount + segments * config::VERTICES_PER_QUAD) > vertexCapacity)
                return vertexCount;

            if (input.dimension == 2)
                emitQuad(a, b, radius);
            else
                emitCylinder(a, b, radius);
            ++bondCount;
        }
    }
    return vertexCount;
}

void BondMeshBuilder::emitCylinder(const glm::vec3& a, const glm::vec3& b, float radius)
{
    glm::vec3 axis = b - a;
    float length = glm::length(axis);
    glm::vec3 direction = length > 0.0f ? axis / length : config::WORLD_UP;

    glm::vec3 left = glm::cross(direction, config::WORLD_UP);
    if (glm::length(left) < 1e-6f)
        left = glm::cross(direction, glm::vec3(1.0f, 0.0f, 0.0f));
    left = glm::normalize(left);
    glm::vec3 up = glm::normalize(glm::cross(left, direction));

    for (int s = 0; s < segments; ++s)
    {
        float angle0 = 2.0f * static_cast<float>(M_PI) * float(s) / float(segments);
        float angle1 = 2.0f * static_cast<float>(M_PI) * float(s + 1) / float(segments);
        float angleMid = 0.5f * (angle0 + angle1);

        glm::vec3 offset0 = radius * (std::cos(angle0) * left + std::sin(angle0) * up);
        glm::vec3 offset1 = radius * (std::cos(angle1) * left + std::sin(angle1) * up);
        glm::vec3 normal = std::cos(angleMid) * left + std::sin(angleMid) * up;

        emitVertex(a + offset0, normal);
        emitVertex(b + offset0, normal);
        emitVertex(b + offset1, normal);
        emitVertex(a + offset0, normal);
        emitVertex(b + offset1, normal);
        emitVertex(a + offset1, normal);
    }
}

void BondMeshBuilder::emitQuad(const glm::vec3& a, const glm::vec3& b, float halfWidth)
{
    glm::vec2 axis(b.x - a.x, b.y - a.y);
    float length = glm::length(axis);
    glm::vec2 direction = length > 0.0f ? axis / length : glm::vec2(1.0f, 0.0f);
    glm::vec3 side(-direction.y * halfWidth, direction.x * halfWidth, 0.0f);
    const glm::vec3 normal(0.0f, 0.0f, 1.0f);

    emitVertex(a + side, normal);
    emitVertex(b + side, normal);
    emitVertex(b - side, normal);
    emitVertex(a + side, normal);
    emitVertex(b - side, normal);
    emitVertex(a - side, normal);
}

void BondMeshBuilder::emitVertex(const glm::vec3& position, const glm::vec3& normal)
{
    size_t offset = static_cast<size_t>(vertexCount) * 3;
    vertices[offset + 0] = position.x;
    vertices[offset + 1] = position.y;
    vertices[offset + 2] = position.z;
    normals[offset + 0] = normal.x;
    normals[offset + 1] = normal.y;
    normals[offset + 2] = normal.z;
    ++vertexCount;
}
