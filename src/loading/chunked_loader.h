#pragma once
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/diagnostic_log.h"
#include "../data/simulation_data.h"

class HostClient;
struct Session;

// A data-level problem with a host response. Non-fatal: the loader logs it and
// moves on to the next request.
class LoadError : public std::runtime_error
{
public:
    LoadError(ErrorKind kind, const std::string& what) : std::runtime_error(what), m_kind(kind) {}
    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Parsing of host responses. Throw LoadError on missing or invalid attributes.
SimulationMetadata parseSimulationMetadata(const nlohmann::json& response);
GeometryDescriptor parseGeometryDescriptor(const std::string& name, const nlohmann::json& response,
                                           std::vector<DiagnosticEntry>& skippedFields);

// Fetches simulation metadata and every geometry's fields from the host.
//
// The loader is a cooperative state machine: update() is called once per render
// tick and never blocks. Work is a queue of host requests processed strictly one
// at a time, depth first, so the requests of one geometry finish before the next
// geometry starts. Dynamic fields are streamed in chunks of chunkSize frames.
class ChunkedLoader
{
public:
    ChunkedLoader(HostClient& client, Session& session);

    // Queues the metadata request; geometries follow once it arrives
    void start();
    void update();

    bool hasStarted() const { return m_started; }
    bool isFinished() const { return m_finished; }
    const std::string& getActivity() const { return m_activity; }
    int getChunksLoaded() const { return m_chunksLoaded; }

    // Queue entry points, also used by the response handlers
    void loadMetadata();
    void loadGeometry(const std::string& name);
    void loadArray(const std::string& name, const std::string& fieldName, StorageClass storage, int components);
    void loadDynamicArray(const std::string& name, const std::string& fieldName, int count);

private:
    struct Task
    {
        std::string method;
        nlohmann::json params;
        std::string description;
        std::function<void(const nlohmann::json&)> onResult;
    };

    struct DynamicArrayState
    {
        std::string geometry;
        std::string fieldName;
        int count = 0;
        FieldBuffer buffer;
    };

    void schedule(Task task);
    void requestChunk(const std::shared_ptr<DynamicArrayState>& state, int frameOffset);
    void handleResponse();
    void issueNext();
    void abort(const std::string& reason);
    void finish();

    HostClient& m_client;
    Session& m_session;

    std::deque<Task> m_queue;
    std::vector<Task> m_staged;     // Tasks scheduled by the handler that is running
    std::optional<Task> m_active;
    std::future<nlohmann::json> m_response;

    bool m_started = false;
    bool m_finished = false;
    int m_chunksLoaded = 0;
    std::string m_activity = "idle";
};
