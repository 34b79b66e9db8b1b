#include "simulation_data.h"

std::optional<StorageClass> parseStorageClass(const std::string& tag)
{
    if (tag == "dynamic") return StorageClass::Dynamic;
    if (tag == "static") return StorageClass::Static;
    if (tag == "global") return StorageClass::Global;
    return std::nullopt;
}

std::optional<ShapeKind> parseShapeKind(const std::string& tag)
{
    if (tag == "Disk") return ShapeKind::Disk;
    if (tag == "Sphere") return ShapeKind::Sphere;
    if (tag == "Bond") return ShapeKind::Bond;
    return std::nullopt;
}

const char* storageClassName(StorageClass storage)
{
    switch (storage)
    {
        case StorageClass::Dynamic: return "dynamic";
        case StorageClass::Static: return "static";
        case StorageClass::Global: return "global";
    }
    return "unknown";
}

const char* shapeKindName(ShapeKind shape)
{
    switch (shape)
    {
        case ShapeKind::Disk: return "Disk";
        case ShapeKind::Sphere: return "Sphere";
        case ShapeKind::Bond: return "Bond";
    }
    return "Unknown";
}

std::optional<int> fieldComponents(const std::string& fieldName, int dimension, int maxNeighbors)
{
    if (fieldName == field::POSITION) return dimension;
    if (fieldName == field::ANGLE) return dimension - 1;
    if (fieldName == field::SIZE) return 1;
    if (fieldName == field::COLOR) return 3;
    if (fieldName == field::DIAMETER) return 1;
    if (fieldName == field::NEIGHBOR_INDEX) return maxNeighbors;
    return std::nullopt;
}

glm::vec3 SimulationMetadata::boxExtent() const
{
    glm::vec3 extent(0.0f);
    for (size_t i = 0; i < boxSize.size() && i < 3; ++i)
        extent[static_cast<int>(i)] = boxSize[i];
    return extent;
}

size_t FieldBuffer::expectedLength(int frameCount, int count) const
{
    switch (storage)
    {
        case StorageClass::Dynamic:
            return static_cast<size_t>(frameCount) * static_cast<size_t>(count) * static_cast<size_t>(components);
        case StorageClass::Static:
            return static_cast<size_t>(count) * static_cast<size_t>(components);
        case StorageClass::Global:
            return static_cast<size_t>(components);
    }
    return 0;
}

size_t FieldBuffer::frameLength(int count) const
{
    if (storage == StorageClass::Global)
        return static_cast<size_t>(components);
    return static_cast<size_t>(count) * static_cast<size_t>(components);
}

const float* FieldBuffer::frameSlice(int frame, int count) const
{
    if (storage == StorageClass::Dynamic)
        return data.data() + static_cast<size_t>(frame) * frameLength(count);
    return data.data();
}

const FieldBuffer* Geometry::findField(const std::string& fieldName) const
{
    auto it = fields.find(fieldName);
    return it == fields.end() ? nullptr : &it->second;
}

bool Geometry::needsVertexBuffer(const std::string& fieldName) const
{
    const FieldBuffer* buffer = findField(fieldName);
    if (!buffer || buffer->storage == StorageClass::Global)
        return false;
    if (descriptor.shape == ShapeKind::Bond && fieldName == field::NEIGHBOR_INDEX)
        return false;
    return true;
}
