#pragma once
#include <map>
#include <string>
#include <vector>
#include "simulation_data.h"

// CPU-side table of every loaded geometry, in the order the host listed them.
// Written by the loader, read by the renderer once loading has finished.
class GeometryRegistry
{
public:
    // Returns the stored geometry; replaces an earlier geometry of the same name
    Geometry& add(const GeometryDescriptor& descriptor);
    Geometry* find(const std::string& name);
    const Geometry* find(const std::string& name) const;

    // Stores a field after checking its length against the storage class.
    // Returns false (and stores nothing) on a length mismatch.
    bool storeField(const std::string& geometryName, const std::string& fieldName, FieldBuffer buffer, int frameCount);
    void removeField(const std::string& geometryName, const std::string& fieldName);

    std::vector<Geometry>& geometries() { return m_geometries; }
    const std::vector<Geometry>& geometries() const { return m_geometries; }
    size_t size() const { return m_geometries.size(); }
    bool empty() const { return m_geometries.empty(); }
    void clear();

private:
    std::vector<Geometry> m_geometries;
    std::map<std::string, size_t> m_indexByName;
};
