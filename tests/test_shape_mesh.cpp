#include <gtest/gtest.h>
#include <cmath>
#include "core/config.h"
#include "rendering/core/mesh/shape_mesh.h"

TEST(ShapeMeshTest, DiskIsAFanOfTriangles) {
    ShapeMesh disk = generateDiskMesh(16, 0.5f);
    EXPECT_EQ(disk.components, 2);
    EXPECT_EQ(disk.vertexCount, 48);
    EXPECT_EQ(disk.positions.size(), 48u * 2u);
    EXPECT_FALSE(disk.hasNormals());

    for (int triangle = 0; triangle < 16; ++triangle) {
        const float* v = &disk.positions[static_cast<size_t>(triangle) * 6];
        EXPECT_FLOAT_EQ(v[0], 0.0f);
        EXPECT_FLOAT_EQ(v[1], 0.0f);
        EXPECT_NEAR(std::hypot(v[2], v[3]), 0.5f, 1e-5f);
        EXPECT_NEAR(std::hypot(v[4], v[5]), 0.5f, 1e-5f);
        // Counter-clockwise winding
        EXPECT_GT(v[2] * v[5] - v[3] * v[4], 0.0f);
    }
}

TEST(ShapeMeshTest, DiskRimCloses) {
    ShapeMesh disk = generateDiskMesh(8, 1.0f);
    const float* last = &disk.positions[7 * 6];
    EXPECT_NEAR(last[4], disk.positions[2], 1e-5f);
    EXPECT_NEAR(last[5], disk.positions[3], 1e-5f);
}

TEST(ShapeMeshTest, SphereVertexCount) {
    ShapeMesh sphere = generateSphereMesh(16, 8, 0.5f);
    EXPECT_EQ(sphere.components, 3);
    EXPECT_EQ(sphere.vertexCount, 16 * 8 * 6);
    EXPECT_EQ(sphere.positions.size(), static_cast<size_t>(sphere.vertexCount) * 3);
    EXPECT_EQ(sphere.normals.size(), sphere.positions.size());
}

TEST(ShapeMeshTest, SphereNormalsAreUnitAndRadial) {
    ShapeMesh sphere = generateSphereMesh(12, 6, 2.0f);
    for (int v = 0; v < sphere.vertexCount; ++v) {
        const float* p = &sphere.positions[static_cast<size_t>(v) * 3];
        const float* n = &sphere.normals[static_cast<size_t>(v) * 3];
        EXPECT_NEAR(std::sqrt(n[0] * n[0] + n[1] * n[1] + n[2] * n[2]), 1.0f, 1e-5f);
        EXPECT_NEAR(std::sqrt(p[0] * p[0] + p[1] * p[1] + p[2] * p[2]), 2.0f, 1e-4f);
        EXPECT_NEAR(n[0] * 2.0f, p[0], 1e-4f);
        EXPECT_NEAR(n[1] * 2.0f, p[1], 1e-4f);
        EXPECT_NEAR(n[2] * 2.0f, p[2], 1e-4f);
    }
}

TEST(ShapeMeshTest, GenerationIsDeterministic) {
    EXPECT_EQ(generateSphereMesh(16, 8, 0.5f).positions, generateSphereMesh(16, 8, 0.5f).positions);
    EXPECT_EQ(generateDiskMesh(16, 0.5f).positions, generateDiskMesh(16, 0.5f).positions);
}

TEST(ShapeMeshTest, SphereRequiresThreeDimensions) {
    DiagnosticLog log;
    EXPECT_FALSE(buildBaseMesh(ShapeKind::Sphere, 2, log).has_value());
    EXPECT_EQ(log.count(ErrorKind::InvalidDimension), 1u);

    std::optional<ShapeMesh> sphere = buildBaseMesh(ShapeKind::Sphere, 3, log);
    ASSERT_TRUE(sphere.has_value());
    EXPECT_TRUE(sphere->hasNormals());
    EXPECT_EQ(log.size(), 1u);
}

TEST(ShapeMeshTest, BaseMeshPerShape) {
    DiagnosticLog log;
    std::optional<ShapeMesh> disk = buildBaseMesh(ShapeKind::Disk, 2, log);
    ASSERT_TRUE(disk.has_value());
    EXPECT_EQ(disk->vertexCount, config::DISK_SEGMENTS * 3);
    EXPECT_FALSE(buildBaseMesh(ShapeKind::Bond, 3, log).has_value());
    EXPECT_TRUE(log.empty());
}
