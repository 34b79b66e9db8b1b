#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <glm/glm.hpp>

// ========== Storage and shape tags ==========

enum class StorageClass
{
    Dynamic,    // One value per particle per frame
    Static,     // One value per particle, shared by all frames
    Global,     // One value for the whole geometry
};

enum class ShapeKind
{
    Disk,
    Sphere,
    Bond,
};

std::optional<StorageClass> parseStorageClass(const std::string& tag);
std::optional<ShapeKind> parseShapeKind(const std::string& tag);
const char* storageClassName(StorageClass storage);
const char* shapeKindName(ShapeKind shape);

// Semantic field names understood by the renderer
namespace field
{
    constexpr const char* POSITION{ "position" };
    constexpr const char* ANGLE{ "angle" };
    constexpr const char* SIZE{ "size" };
    constexpr const char* COLOR{ "color" };
    constexpr const char* DIAMETER{ "diameter" };
    constexpr const char* NEIGHBOR_INDEX{ "neighbor_idx" };
}

// Components per value for a field, fixed by its name. Empty for names the
// renderer does not know.
std::optional<int> fieldComponents(const std::string& fieldName, int dimension, int maxNeighbors);

// ========== Loaded data ==========

struct SimulationMetadata
{
    int dimension = 3;
    std::vector<float> boxSize;
    int frameCount = 1;
    int chunkSize = 1;
    int simulationIndex = 0;
    std::optional<glm::vec3> backgroundColor;
    std::optional<glm::ivec2> resolution;
    std::vector<std::string> geometryNames;

    // Box extents padded to three components (z = 0 in 2D)
    glm::vec3 boxExtent() const;
};

struct FieldBuffer
{
    StorageClass storage = StorageClass::Static;
    int components = 1;
    std::vector<float> data;

    size_t expectedLength(int frameCount, int count) const;
    // Floats covering one frame: count * components, or components for Global
    size_t frameLength(int count) const;
    // Start of the values for a frame. Static and Global fields ignore the frame.
    const float* frameSlice(int frame, int count) const;
};

struct GeometryDescriptor
{
    std::string name;
    ShapeKind shape = ShapeKind::Disk;
    int count = 0;
    std::map<std::string, StorageClass> fields;
    std::optional<std::string> referenceGeometry;   // Bond only
    int maxNeighbors = 0;                           // Bond only
};

struct Geometry
{
    GeometryDescriptor descriptor;
    std::map<std::string, FieldBuffer> fields;

    const FieldBuffer* findField(const std::string& fieldName) const;
    bool hasField(const std::string& fieldName) const { return findField(fieldName) != nullptr; }
    // Fields that live in a GPU vertex buffer: everything but Global fields and
    // a bond's neighbor table
    bool needsVertexBuffer(const std::string& fieldName) const;
};
