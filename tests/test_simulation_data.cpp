#include <gtest/gtest.h>
#include "data/geometry_registry.h"
#include "data/simulation_data.h"

TEST(SimulationDataTest, ComponentRuleFollowsFieldName) {
    EXPECT_EQ(fieldComponents("position", 2, 0), 2);
    EXPECT_EQ(fieldComponents("position", 3, 0), 3);
    EXPECT_EQ(fieldComponents("angle", 2, 0), 1);
    EXPECT_EQ(fieldComponents("angle", 3, 0), 2);
    EXPECT_EQ(fieldComponents("size", 3, 0), 1);
    EXPECT_EQ(fieldComponents("color", 2, 0), 3);
    EXPECT_EQ(fieldComponents("diameter", 3, 0), 1);
    EXPECT_EQ(fieldComponents("neighbor_idx", 3, 6), 6);
    EXPECT_FALSE(fieldComponents("velocity", 3, 0).has_value());
}

TEST(SimulationDataTest, ParsesTags) {
    EXPECT_EQ(parseStorageClass("dynamic"), StorageClass::Dynamic);
    EXPECT_EQ(parseStorageClass("static"), StorageClass::Static);
    EXPECT_EQ(parseStorageClass("global"), StorageClass::Global);
    EXPECT_FALSE(parseStorageClass("streamed").has_value());

    EXPECT_EQ(parseShapeKind("Disk"), ShapeKind::Disk);
    EXPECT_EQ(parseShapeKind("Sphere"), ShapeKind::Sphere);
    EXPECT_EQ(parseShapeKind("Bond"), ShapeKind::Bond);
    EXPECT_FALSE(parseShapeKind("Cube").has_value());
}

TEST(SimulationDataTest, ExpectedLengthPerStorageClass) {
    FieldBuffer buffer;
    buffer.components = 3;

    buffer.storage = StorageClass::Dynamic;
    EXPECT_EQ(buffer.expectedLength(10, 4), 120u);
    EXPECT_EQ(buffer.frameLength(4), 12u);

    buffer.storage = StorageClass::Static;
    EXPECT_EQ(buffer.expectedLength(10, 4), 12u);

    buffer.storage = StorageClass::Global;
    EXPECT_EQ(buffer.expectedLength(10, 4), 3u);
    EXPECT_EQ(buffer.frameLength(4), 3u);
}

TEST(SimulationDataTest, FrameSliceOnlyMovesForDynamic) {
    FieldBuffer dynamic;
    dynamic.storage = StorageClass::Dynamic;
    dynamic.components = 2;
    dynamic.data = { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11 }; // 3 frames, 2 particles
    EXPECT_EQ(dynamic.frameSlice(0, 2)[0], 0.0f);
    EXPECT_EQ(dynamic.frameSlice(2, 2)[0], 8.0f);

    FieldBuffer stat;
    stat.storage = StorageClass::Static;
    stat.components = 2;
    stat.data = { 5, 6, 7, 8 };
    EXPECT_EQ(stat.frameSlice(2, 2), stat.data.data());
}

TEST(SimulationDataTest, BoxExtentIsPaddedIn2D) {
    SimulationMetadata metadata;
    metadata.dimension = 2;
    metadata.boxSize = { 4.0f, 6.0f };
    glm::vec3 extent = metadata.boxExtent();
    EXPECT_FLOAT_EQ(extent.x, 4.0f);
    EXPECT_FLOAT_EQ(extent.y, 6.0f);
    EXPECT_FLOAT_EQ(extent.z, 0.0f);
}

TEST(SimulationDataTest, BondNeighborTableHasNoVertexBuffer) {
    Geometry bond;
    bond.descriptor.shape = ShapeKind::Bond;
    bond.fields["neighbor_idx"].storage = StorageClass::Static;
    bond.fields["color"].storage = StorageClass::Global;
    bond.fields["diameter"].storage = StorageClass::Static;
    EXPECT_FALSE(bond.needsVertexBuffer("neighbor_idx"));
    EXPECT_FALSE(bond.needsVertexBuffer("color"));
    EXPECT_TRUE(bond.needsVertexBuffer("diameter"));

    Geometry disks;
    disks.descriptor.shape = ShapeKind::Disk;
    disks.fields["neighbor_idx"].storage = StorageClass::Static;
    EXPECT_TRUE(disks.needsVertexBuffer("neighbor_idx"));
}

class GeometryRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        GeometryDescriptor descriptor;
        descriptor.name = "particles";
        descriptor.count = 4;
        descriptor.fields["position"] = StorageClass::Dynamic;
        registry.add(descriptor);
    }

    GeometryRegistry registry;
};

TEST_F(GeometryRegistryTest, FindsByName) {
    ASSERT_NE(registry.find("particles"), nullptr);
    EXPECT_EQ(registry.find("particles")->descriptor.count, 4);
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST_F(GeometryRegistryTest, KeepsHostOrder) {
    GeometryDescriptor second;
    second.name = "bonds";
    registry.add(second);
    GeometryDescriptor third;
    third.name = "alpha";
    registry.add(third);

    ASSERT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.geometries()[0].descriptor.name, "particles");
    EXPECT_EQ(registry.geometries()[1].descriptor.name, "bonds");
    EXPECT_EQ(registry.geometries()[2].descriptor.name, "alpha");
    EXPECT_EQ(registry.find("alpha")->descriptor.name, "alpha");
}

TEST_F(GeometryRegistryTest, StoresFieldOfExpectedLength) {
    FieldBuffer buffer;
    buffer.storage = StorageClass::Dynamic;
    buffer.components = 2;
    buffer.data.assign(5 * 4 * 2, 1.0f);
    EXPECT_TRUE(registry.storeField("particles", "position", buffer, 5));
    EXPECT_TRUE(registry.find("particles")->hasField("position"));
}

TEST_F(GeometryRegistryTest, RejectsFieldOfWrongLength) {
    FieldBuffer buffer;
    buffer.storage = StorageClass::Dynamic;
    buffer.components = 2;
    buffer.data.assign(5 * 4 * 2 - 1, 1.0f);
    EXPECT_FALSE(registry.storeField("particles", "position", buffer, 5));
    EXPECT_FALSE(registry.find("particles")->hasField("position"));
}

TEST_F(GeometryRegistryTest, RejectsFieldForUnknownGeometry) {
    FieldBuffer buffer;
    buffer.storage = StorageClass::Global;
    buffer.components = 1;
    buffer.data = { 1.0f };
    EXPECT_FALSE(registry.storeField("missing", "size", buffer, 5));
}

TEST_F(GeometryRegistryTest, RemovesField) {
    FieldBuffer buffer;
    buffer.storage = StorageClass::Global;
    buffer.components = 1;
    buffer.data = { 2.0f };
    ASSERT_TRUE(registry.storeField("particles", "size", buffer, 5));
    registry.removeField("particles", "size");
    EXPECT_FALSE(registry.find("particles")->hasField("size"));
}
