#pragma once
#include <optional>
#include <vector>
#include "../../../core/diagnostic_log.h"
#include "../../../data/simulation_data.h"

// Base mesh for one canonical particle shape. Built once and shared by every
// instance of that shape through instanced drawing.
struct ShapeMesh
{
    int components = 3;             // Floats per vertex position
    std::vector<float> positions;
    std::vector<float> normals;     // Three floats per vertex, empty when the shape has none
    int vertexCount = 0;

    bool hasNormals() const { return !normals.empty(); }
};

// Fan of `segments` triangles around the origin in the XY plane (2 components)
ShapeMesh generateDiskMesh(int segments, float radius);

// Latitude/longitude sphere centered on the origin. Every grid cell becomes two
// triangles; normals are the normalized vertex positions.
ShapeMesh generateSphereMesh(int hSegments, int vSegments, float radius);

// Mesh for a particle geometry using the configured segment counts. Bonds have
// no base mesh. A sphere outside a 3D simulation is a configuration error and is
// reported instead of built.
std::optional<ShapeMesh> buildBaseMesh(ShapeKind shape, int dimension, DiagnosticLog& log);
