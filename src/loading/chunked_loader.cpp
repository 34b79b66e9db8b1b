#include "chunked_loader.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>
#include "../core/config.h"
#include "../core/session.h"
#include "../data/base64_decoder.h"
#include "../host/host_client.h"
#include "../utils/timer.h"

namespace
{
    const nlohmann::json& require(const nlohmann::json& object, const char* key, const std::string& context)
    {
        if (!object.is_object() || !object.contains(key) || object[key].is_null())
            throw LoadError(ErrorKind::MissingField, context + " is missing '" + key + "'");
        return object[key];
    }

    std::vector<float> decodePayload(const nlohmann::json& result, const char* key, const std::string& context)
    {
        if (!result.is_object() || !result.contains(key) || !result[key].is_string())
            throw LoadError(ErrorKind::MissingArrayPayload, context + ": response has no '" + key + "' data");
        return decodeFloat32Array(result[key].get<std::string>());
    }
}

// ========== Response parsing ==========

SimulationMetadata parseSimulationMetadata(const nlohmann::json& response)
{
    SimulationMetadata metadata;

    metadata.dimension = require(response, "dimension", "simulation metadata").get<int>();
    if (metadata.dimension != 2 && metadata.dimension != 3)
        throw LoadError(ErrorKind::InvalidDimension, "simulation dimension " + std::to_string(metadata.dimension) + " is not 2 or 3");

    metadata.boxSize = require(response, "box_size", "simulation metadata").get<std::vector<float>>();
    if (static_cast<int>(metadata.boxSize.size()) != metadata.dimension)
        throw LoadError(ErrorKind::InvalidDimension, "box_size has " + std::to_string(metadata.boxSize.size()) +
                        " extents for a " + std::to_string(metadata.dimension) + "D simulation");

    metadata.frameCount = require(response, "frame_count", "simulation metadata").get<int>();
    if (metadata.frameCount <= 0)
        throw LoadError(ErrorKind::MissingField, "frame_count must be positive, got " + std::to_string(metadata.frameCount));

    metadata.simulationIndex = response.value("simulation_idx", config::DEFAULT_SIMULATION_INDEX);
    metadata.chunkSize = response.value("chunk_size", config::DEFAULT_CHUNK_SIZE);
    if (metadata.chunkSize <= 0)
        metadata.chunkSize = config::DEFAULT_CHUNK_SIZE;

    if (response.contains("background_color") && !response["background_color"].is_null())
    {
        std::vector<float> color = response["background_color"].get<std::vector<float>>();
        if (color.size() >= 3)
            metadata.backgroundColor = glm::vec3(color[0], color[1], color[2]);
    }
    if (response.contains("resolution") && !response["resolution"].is_null())
    {
        std::vector<int> resolution = response["resolution"].get<std::vector<int>>();
        if (resolution.size() >= 2)
            metadata.resolution = glm::ivec2(resolution[0], resolution[1]);
    }
    if (response.contains("geometry") && !response["geometry"].is_null())
        metadata.geometryNames = response["geometry"].get<std::vector<std::string>>();

    return metadata;
}

GeometryDescriptor parseGeometryDescriptor(const std::string& name, const nlohmann::json& response,
                                           std::vector<DiagnosticEntry>& skippedFields)
{
    const std::string context = "geometry '" + name + "'";
    GeometryDescriptor descriptor;
    descriptor.name = name;

    std::string shapeTag = require(response, "shape", context).get<std::string>();
    std::optional<ShapeKind> shape = parseShapeKind(shapeTag);
    if (!shape)
        throw LoadError(ErrorKind::MissingField, context + " has unknown shape '" + shapeTag + "'");
    descriptor.shape = *shape;

    descriptor.count = require(response, "count", context).get<int>();
    if (descriptor.count < 0)
        throw LoadError(ErrorKind::MissingField, context + " has a negative particle count");

    if (descriptor.shape == ShapeKind::Bond)
    {
        descriptor.referenceGeometry = require(response, "reference_geometry", context).get<std::string>();
        descriptor.maxNeighbors = require(response, "max_neighbors", context).get<int>();
        if (descriptor.maxNeighbors <= 0)
            throw LoadError(ErrorKind::MissingField, context + " needs a positive max_neighbors");
    }

    const nlohmann::json& fields = require(response, "fields", context);
    for (auto it = fields.begin(); it != fields.end(); ++it)
    {
        std::string tag = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        std::optional<StorageClass> storage = parseStorageClass(tag);
        if (!storage)
        {
            skippedFields.push_back({ ErrorKind::UnknownStorageClass,
                context + " field '" + it.key() + "' has unknown storage class '" + tag + "'" });
            continue;
        }
        descriptor.fields[it.key()] = *storage;
    }
    return descriptor;
}

// ========== Loader ==========

ChunkedLoader::ChunkedLoader(HostClient& client, Session& session)
    : m_client(client), m_session(session)
{
}

void ChunkedLoader::start()
{
    if (m_started)
        return;
    m_started = true;
    std::cout << "ChunkedLoader: requesting simulation metadata\n";
    loadMetadata();
    for (Task& task : m_staged)
        m_queue.push_back(std::move(task));
    m_staged.clear();
    issueNext();
}

void ChunkedLoader::update()
{
    if (!m_started || m_finished)
        return;

    m_client.pump();
    if (m_active && m_response.valid() &&
        m_response.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
    {
        handleResponse();
    }
    if (!m_active && !m_finished)
        issueNext();
}

void ChunkedLoader::schedule(Task task)
{
    m_staged.push_back(std::move(task));
}

void ChunkedLoader::loadMetadata()
{
    schedule({ "GetSimulationMetadata", nlohmann::json::object(), "simulation metadata",
        [this](const nlohmann::json& result)
        {
            SimulationMetadata metadata = parseSimulationMetadata(result);
            m_session.metadata = metadata;
            m_session.camera.configure(metadata.dimension, metadata.boxExtent());
            if (metadata.backgroundColor)
                m_session.backgroundColor = *metadata.backgroundColor;

            std::cout << "ChunkedLoader: " << metadata.dimension << "D simulation, " << metadata.frameCount
                      << " frames, chunk size " << metadata.chunkSize << ", "
                      << metadata.geometryNames.size() << " geometries\n";

            if (metadata.geometryNames.empty())
                m_session.log.report(ErrorKind::MissingField, "simulation metadata lists no geometry");
            for (const std::string& name : metadata.geometryNames)
                loadGeometry(name);
        } });
}

void ChunkedLoader::loadGeometry(const std::string& name)
{
    schedule({ "GetGeometryMetadata", { { "name", name } }, "geometry '" + name + "'",
        [this, name](const nlohmann::json& result)
        {
            std::vector<DiagnosticEntry> skipped;
            GeometryDescriptor descriptor = parseGeometryDescriptor(name, result, skipped);
            for (const DiagnosticEntry& entry : skipped)
                m_session.log.report(entry.kind, entry.message);

            const SimulationMetadata& metadata = *m_session.metadata;
            m_session.registry.add(descriptor);
            std::cout << "ChunkedLoader: geometry '" << name << "' is a " << shapeKindName(descriptor.shape)
                      << " with " << descriptor.count << " particles\n";

            for (const auto& [fieldName, storage] : descriptor.fields)
            {
                std::optional<int> components = fieldComponents(fieldName, metadata.dimension, descriptor.maxNeighbors);
                if (!components)
                {
                    m_session.log.report(ErrorKind::UnsupportedField,
                        "geometry '" + name + "' field '" + fieldName + "' is not a known field, skipped");
                    continue;
                }

                switch (storage)
                {
                    case StorageClass::Dynamic:
                        loadDynamicArray(name, fieldName, descriptor.count);
                        break;
                    case StorageClass::Static:
                    case StorageClass::Global:
                        loadArray(name, fieldName, storage, *components);
                        break;
                }
            }
        } });
}

void ChunkedLoader::loadArray(const std::string& name, const std::string& fieldName, StorageClass storage, int components)
{
    std::string description = "'" + name + "." + fieldName + "'";
    schedule({ "GetArray", { { "name", name }, { "field", fieldName } }, description,
        [this, name, fieldName, storage, components, description](const nlohmann::json& result)
        {
            FieldBuffer buffer;
            buffer.storage = storage;
            buffer.components = components;
            buffer.data = decodePayload(result, "array", description);

            size_t received = buffer.data.size();
            if (!m_session.registry.storeField(name, fieldName, std::move(buffer), m_session.getFrameCount()))
                throw LoadError(ErrorKind::MissingArrayPayload, description + ": " + std::to_string(received) +
                                " values do not fit a " + storageClassName(storage) + " field");
        } });
}

void ChunkedLoader::loadDynamicArray(const std::string& name, const std::string& fieldName, int count)
{
    const SimulationMetadata& metadata = *m_session.metadata;
    const Geometry* geometry = m_session.registry.find(name);
    int maxNeighbors = geometry ? geometry->descriptor.maxNeighbors : 0;

    auto state = std::make_shared<DynamicArrayState>();
    state->geometry = name;
    state->fieldName = fieldName;
    state->count = count;
    state->buffer.storage = StorageClass::Dynamic;
    state->buffer.components = fieldComponents(fieldName, metadata.dimension, maxNeighbors).value_or(1);
    // The whole trajectory is allocated up front; chunks are written at their frame offset
    state->buffer.data.assign(state->buffer.expectedLength(metadata.frameCount, count), 0.0f);

    requestChunk(state, 0);
}

void ChunkedLoader::requestChunk(const std::shared_ptr<DynamicArrayState>& state, int frameOffset)
{
    const SimulationMetadata& metadata = *m_session.metadata;
    int frames = std::min(metadata.chunkSize, metadata.frameCount - frameOffset);
    std::string description = "'" + state->geometry + "." + state->fieldName + "' frames " +
                              std::to_string(frameOffset) + "-" + std::to_string(frameOffset + frames - 1);

    nlohmann::json params = {
        { "name", state->geometry },
        { "field", state->fieldName },
        { "frame_offset", frameOffset },
        { "frame_count", frames },
    };

    schedule({ "GetArrayChunk", std::move(params), description,
        [this, state, frameOffset, frames, description](const nlohmann::json& result)
        {
            std::vector<float> chunk;
            {
                TimerCPU timer("Chunk Decode");
                chunk = decodePayload(result, "array_chunk", description);
            }

            size_t frameLength = state->buffer.frameLength(state->count);
            size_t expected = frameLength * static_cast<size_t>(frames);
            if (chunk.size() != expected)
                throw LoadError(ErrorKind::MissingArrayPayload, description + ": expected " + std::to_string(expected) +
                                " values, received " + std::to_string(chunk.size()));

            std::copy(chunk.begin(), chunk.end(), state->buffer.data.begin() + static_cast<std::ptrdiff_t>(frameLength * frameOffset));
            ++m_chunksLoaded;

            int nextOffset = frameOffset + frames;
            if (nextOffset < m_session.getFrameCount())
            {
                requestChunk(state, nextOffset);
                return;
            }
            if (!m_session.registry.storeField(state->geometry, state->fieldName, std::move(state->buffer), m_session.getFrameCount()))
                throw LoadError(ErrorKind::MissingArrayPayload, "'" + state->geometry + "." + state->fieldName + "' could not be stored");
        } });
}

void ChunkedLoader::handleResponse()
{
    Task task = std::move(*m_active);
    m_active.reset();

    try
    {
        nlohmann::json result = m_response.get();
        task.onResult(result);
    }
    catch (const LoadError& e)
    {
        m_session.log.report(e.kind(), e.what());
    }
    catch (const MalformedPayloadError& e)
    {
        m_session.log.report(ErrorKind::MalformedPayload, task.description + ": " + e.what());
    }
    catch (const nlohmann::json::exception& e)
    {
        m_session.log.report(ErrorKind::MissingField, task.description + ": " + e.what());
    }
    catch (const HostError& e)
    {
        m_session.log.report(ErrorKind::HostFailure, task.description + ": " + e.what());
    }
    catch (const HostTransportError& e)
    {
        m_staged.clear();
        abort(task.description + ": " + e.what());
        return;
    }
    catch (const std::exception& e)
    {
        m_session.log.report(ErrorKind::MissingArrayPayload, task.description + ": " + e.what());
    }

    // Work scheduled by this response runs before anything queued earlier
    for (auto it = m_staged.rbegin(); it != m_staged.rend(); ++it)
        m_queue.push_front(std::move(*it));
    m_staged.clear();
}

void ChunkedLoader::issueNext()
{
    if (m_active)
        return;
    if (m_queue.empty())
    {
        finish();
        return;
    }

    m_active = std::move(m_queue.front());
    m_queue.pop_front();
    m_activity = "Loading " + m_active->description;

    try
    {
        m_response = m_client.call(m_active->method, m_active->params);
    }
    catch (const std::logic_error& e)
    {
        // The client already has a request outstanding; retry on the next tick
        std::cerr << "ChunkedLoader: " << e.what() << "\n";
        m_queue.push_front(std::move(*m_active));
        m_active.reset();
    }
}

void ChunkedLoader::abort(const std::string& reason)
{
    m_session.log.report(ErrorKind::HostFailure, reason + " (loading stopped)");
    m_queue.clear();
    finish();
}

void ChunkedLoader::finish()
{
    m_finished = true;
    m_session.loaded = m_session.metadata.has_value();
    m_activity = m_session.loaded ? "Loaded" : "Loading failed";
    std::cout << "ChunkedLoader: " << m_activity << " after " << m_client.requestsCompleted() << " requests, "
              << m_session.registry.size() << " geometries\n";
}
