#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "rendering/core/mesh/bond_mesh_builder.h"

namespace {

constexpr int VERTICES_PER_BOND = config::BOND_SEGMENTS * config::VERTICES_PER_QUAD;

BondFrameInput makeInput(const std::vector<float>& positions, const std::vector<float>& neighbors,
                         int maxNeighbors, int dimension, glm::vec3 box) {
    BondFrameInput input;
    input.positions = positions.data();
    input.particleCount = static_cast<int>(positions.size()) / dimension;
    input.neighbors = neighbors.data();
    input.count = input.particleCount;
    input.maxNeighbors = maxNeighbors;
    input.dimension = dimension;
    input.boxExtent = box;
    input.diameter = 0.2f;
    return input;
}

} // namespace

TEST(BondMeshBuilderTest, SymmetricTableEmitsEachBondOnce) {
    // Triangle of particles, everybody bonded to everybody, -1 = unused slot
    std::vector<float> positions = { 1, 1, 1,  2, 1, 1,  1, 2, 1 };
    std::vector<float> neighbors = { 1, 2, -1,  0, 2, -1,  0, 1, -1 };
    BondMeshBuilder builder(3, 3);

    int vertices = builder.rebuild(makeInput(positions, neighbors, 3, 3, glm::vec3(10.0f)));
    EXPECT_EQ(builder.getBondCount(), 3);
    EXPECT_EQ(vertices, 3 * VERTICES_PER_BOND);
    EXPECT_EQ(builder.getVertexCount(), vertices);
}

TEST(BondMeshBuilderTest, SelfAndUnusedSlotsAreSkipped) {
    std::vector<float> positions = { 1, 1, 1,  2, 1, 1 };
    // Unused slots hold the particle's own index or something larger
    std::vector<float> neighbors = { 0, 5,  1, 0 };
    BondMeshBuilder builder(2, 2);

    builder.rebuild(makeInput(positions, neighbors, 2, 3, glm::vec3(10.0f)));
    EXPECT_EQ(builder.getBondCount(), 1);
}

TEST(BondMeshBuilderTest, NeighborIndicesAreRounded) {
    std::vector<float> positions = { 1, 1, 1,  2, 1, 1 };
    std::vector<float> neighbors = { -1, 0.0001f };
    BondMeshBuilder builder(2, 1);
    builder.rebuild(makeInput(positions, neighbors, 1, 3, glm::vec3(10.0f)));
    EXPECT_EQ(builder.getBondCount(), 1);
}

TEST(BondMeshBuilderTest, RejectsBondsAcrossPeriodicBoundary) {
    std::vector<float> farApart = { 1, 5, 5,  7, 5, 5 };     // dx = 6 > 5
    std::vector<float> close = { 1, 5, 5,  5, 5, 5 };        // dx = 4
    std::vector<float> neighbors = { -1, 0 };
    BondMeshBuilder builder(2, 1);

    EXPECT_EQ(builder.rebuild(makeInput(farApart, neighbors, 1, 3, glm::vec3(10.0f))), 0);
    EXPECT_EQ(builder.getWrapRejectedCount(), 1);

    EXPECT_EQ(builder.rebuild(makeInput(close, neighbors, 1, 3, glm::vec3(10.0f))), VERTICES_PER_BOND);
    EXPECT_EQ(builder.getWrapRejectedCount(), 0);
}

TEST(BondMeshBuilderTest, PeriodicCheckLooksAtEveryAxis) {
    glm::vec3 box(10.0f, 4.0f, 10.0f);
    EXPECT_FALSE(BondMeshBuilder::crossesPeriodicBoundary({ 0, 0, 0 }, { 5, 2, 5 }, box, 3));
    EXPECT_TRUE(BondMeshBuilder::crossesPeriodicBoundary({ 0, 0, 0 }, { 1, 2.5f, 1 }, box, 3));
    EXPECT_TRUE(BondMeshBuilder::crossesPeriodicBoundary({ 0, 0, 9 }, { 0, 0, 1 }, box, 3));
    // z is not part of a 2D box
    EXPECT_FALSE(BondMeshBuilder::crossesPeriodicBoundary({ 0, 0, 9 }, { 0, 0, 1 }, box, 2));
}

TEST(BondMeshBuilderTest, CylinderHasFlatSidesAroundTheAxis) {
    std::vector<float> positions = { 0, 0, 0,  0, 0, 2 };
    std::vector<float> neighbors = { -1, 0 };
    BondMeshBuilder builder(2, 1);
    int vertices = builder.rebuild(makeInput(positions, neighbors, 1, 3, glm::vec3(10.0f)));
    ASSERT_EQ(vertices, VERTICES_PER_BOND);

    const std::vector<float>& v = builder.getVertices();
    const std::vector<float>& n = builder.getNormals();
    for (int segment = 0; segment < config::BOND_SEGMENTS; ++segment) {
        size_t first = static_cast<size_t>(segment) * config::VERTICES_PER_QUAD * 3;
        glm::vec3 normal(n[first], n[first + 1], n[first + 2]);
        EXPECT_NEAR(glm::length(normal), 1.0f, 1e-5f);
        EXPECT_NEAR(normal.z, 0.0f, 1e-5f);
        for (int k = 0; k < config::VERTICES_PER_QUAD; ++k) {
            size_t at = first + static_cast<size_t>(k) * 3;
            EXPECT_FLOAT_EQ(n[at], normal.x);
            EXPECT_FLOAT_EQ(n[at + 1], normal.y);
            EXPECT_FLOAT_EQ(n[at + 2], normal.z);
            // Every vertex sits on the cylinder surface
            EXPECT_NEAR(std::hypot(v[at], v[at + 1]), 0.1f, 1e-5f);
        }
    }
}

TEST(BondMeshBuilderTest, VerticalBondUsesFallbackBasis) {
    // Parallel to world up, so the first cross product vanishes
    std::vector<float> positions = { 0, 0, 0,  0, 3, 0 };
    std::vector<float> neighbors = { -1, 0 };
    BondMeshBuilder builder(2, 1);
    ASSERT_EQ(builder.rebuild(makeInput(positions, neighbors, 1, 3, glm::vec3(10.0f))), VERTICES_PER_BOND);
    for (int i = 0; i < VERTICES_PER_BOND * 3; ++i)
        EXPECT_FALSE(std::isnan(builder.getVertices()[static_cast<size_t>(i)]));
}

TEST(BondMeshBuilderTest, TwoDimensionalBondIsAQuad) {
    std::vector<float> positions = { 1, 1,  3, 1 };
    std::vector<float> neighbors = { -1, 0 };
    BondMeshBuilder builder(2, 1);
    int vertices = builder.rebuild(makeInput(positions, neighbors, 1, 2, glm::vec3(10.0f, 10.0f, 0.0f)));
    ASSERT_EQ(vertices, config::VERTICES_PER_QUAD);

    const std::vector<float>& v = builder.getVertices();
    for (int k = 0; k < vertices; ++k) {
        EXPECT_FLOAT_EQ(v[static_cast<size_t>(k) * 3 + 2], 0.0f);
        EXPECT_NEAR(std::fabs(v[static_cast<size_t>(k) * 3 + 1] - 1.0f), 0.1f, 1e-5f);
        EXPECT_FLOAT_EQ(builder.getNormals()[static_cast<size_t>(k) * 3 + 2], 1.0f);
    }
}

TEST(BondMeshBuilderTest, CapacityCoversEverySlot) {
    BondMeshBuilder builder(5, 4);
    EXPECT_EQ(builder.getVertexCapacity(), static_cast<size_t>(5 * 4 * VERTICES_PER_BOND));
    EXPECT_EQ(builder.getVertices().size(), builder.getVertexCapacity() * 3);
}

TEST(BondMeshBuilderTest, RebuildOverwritesPreviousFrame) {
    std::vector<float> positions = { 1, 1, 1,  2, 1, 1,  1, 2, 1 };
    std::vector<float> all = { -1, -1,  0, -1,  0, 1 };
    std::vector<float> one = { -1, -1,  0, -1,  -1, -1 };
    BondMeshBuilder builder(3, 2);

    EXPECT_EQ(builder.rebuild(makeInput(positions, all, 2, 3, glm::vec3(10.0f))), 3 * VERTICES_PER_BOND);
    EXPECT_EQ(builder.rebuild(makeInput(positions, one, 2, 3, glm::vec3(10.0f))), VERTICES_PER_BOND);
    EXPECT_EQ(builder.getBondCount(), 1);
}

TEST(BondMeshBuilderTest, MissingInputDrawsNothing) {
    BondMeshBuilder builder(2, 1);
    EXPECT_EQ(builder.rebuild(BondFrameInput{}), 0);
}
