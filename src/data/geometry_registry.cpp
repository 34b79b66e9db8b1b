#include "geometry_registry.h"
#include <utility>

Geometry& GeometryRegistry::add(const GeometryDescriptor& descriptor)
{
    auto it = m_indexByName.find(descriptor.name);
    if (it != m_indexByName.end())
    {
        Geometry& existing = m_geometries[it->second];
        existing.descriptor = descriptor;
        existing.fields.clear();
        return existing;
    }

    m_indexByName[descriptor.name] = m_geometries.size();
    m_geometries.push_back(Geometry{ descriptor, {} });
    return m_geometries.back();
}

Geometry* GeometryRegistry::find(const std::string& name)
{
    auto it = m_indexByName.find(name);
    return it == m_indexByName.end() ? nullptr : &m_geometries[it->second];
}

const Geometry* GeometryRegistry::find(const std::string& name) const
{
    auto it = m_indexByName.find(name);
    return it == m_indexByName.end() ? nullptr : &m_geometries[it->second];
}

bool GeometryRegistry::storeField(const std::string& geometryName, const std::string& fieldName, FieldBuffer buffer, int frameCount)
{
    Geometry* geometry = find(geometryName);
    if (!geometry)
        return false;
    if (buffer.data.size() != buffer.expectedLength(frameCount, geometry->descriptor.count))
        return false;

    geometry->fields[fieldName] = std::move(buffer);
    return true;
}

void GeometryRegistry::removeField(const std::string& geometryName, const std::string& fieldName)
{
    if (Geometry* geometry = find(geometryName))
        geometry->fields.erase(fieldName);
}

void GeometryRegistry::clear()
{
    m_geometries.clear();
    m_indexByName.clear();
}
