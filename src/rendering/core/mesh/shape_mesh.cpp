#include "shape_mesh.h"
#include <cmath>
#include <glm/glm.hpp>
#include "../../../core/config.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

ShapeMesh generateDiskMesh(int segments, float radius)
{
    ShapeMesh mesh;
    mesh.components = 2;
    mesh.positions.reserve(static_cast<size_t>(segments) * 3 * 2);

    for (int i = 0; i < segments; ++i)
    {
        float angle0 = 2.0f * static_cast<float>(M_PI) * float(i) / float(segments);
        float angle1 = 2.0f * static_cast<float>(M_PI) * float(i + 1) / float(segments);

        // Counter-clockwise: center, current rim point, next rim point
        mesh.positions.insert(mesh.positions.end(), {
            0.0f, 0.0f,
            radius * std::cos(angle0), radius * std::sin(angle0),
            radius * std::cos(angle1), radius * std::sin(angle1),
        });
    }
    mesh.vertexCount = segments * 3;
    return mesh;
}

ShapeMesh generateSphereMesh(int hSegments, int vSegments, float radius)
{
    ShapeMesh mesh;
    mesh.components = 3;
    size_t vertexCapacity = static_cast<size_t>(hSegments) * static_cast<size_t>(vSegments) * config::VERTICES_PER_QUAD;
    mesh.positions.reserve(vertexCapacity * 3);
    mesh.normals.reserve(vertexCapacity * 3);

    auto pointAt = [radius](int lat, int lon, int hSeg, int vSeg)
    {
        float theta = static_cast<float>(M_PI) * float(lat) / float(vSeg);
        float phi = 2.0f * static_cast<float>(M_PI) * float(lon) / float(hSeg);
        return glm::vec3(radius * std::sin(theta) * std::cos(phi),
                         radius * std::cos(theta),
                         radius * std::sin(theta) * std::sin(phi));
    };

    auto emit = [&mesh](const glm::vec3& p)
    {
        glm::vec3 n = glm::normalize(p);
        mesh.positions.insert(mesh.positions.end(), { p.x, p.y, p.z });
        mesh.normals.insert(mesh.normals.end(), { n.x, n.y, n.z });
    };

    for (int lat = 0; lat < vSegments; ++lat)
    {
        for (int lon = 0; lon < hSegments; ++lon)
        {
            glm::vec3 p00 = pointAt(lat, lon, hSegments, vSegments);
            glm::vec3 p01 = pointAt(lat, lon + 1, hSegments, vSegments);
            glm::vec3 p10 = pointAt(lat + 1, lon, hSegments, vSegments);
            glm::vec3 p11 = pointAt(lat + 1, lon + 1, hSegments, vSegments);

            emit(p00); emit(p01); emit(p10);
            emit(p01); emit(p11); emit(p10);
        }
    }
    mesh.vertexCount = hSegments * vSegments * config::VERTICES_PER_QUAD;
    return mesh;
}

std::optional<ShapeMesh> buildBaseMesh(ShapeKind shape, int dimension, DiagnosticLog& log)
{
    switch (shape)
    {
        case ShapeKind::Disk:
            return generateDiskMesh(config::DISK_SEGMENTS, config::DISK_RADIUS);
        case ShapeKind::Sphere:
            if (dimension != 3)
            {
                log.report(ErrorKind::InvalidDimension, "Sphere geometry requested in a " + std::to_string(dimension) + "D simulation");
                return std::nullopt;
            }
            return generateSphereMesh(config::SPHERE_H_SEGMENTS, config::SPHERE_V_SEGMENTS, config::SPHERE_RADIUS);
        case ShapeKind::Bond:
            return std::nullopt;
    }
    return std::nullopt;
}
