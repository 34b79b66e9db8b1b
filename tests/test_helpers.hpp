#pragma once
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "host/host_transport.h"
#include "loading/chunked_loader.h"

namespace testing_support {

inline std::string encodeBase64(const std::vector<uint8_t>& bytes) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t triple = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += alphabet[(triple >> 18) & 63];
        out += alphabet[(triple >> 12) & 63];
        out += alphabet[(triple >> 6) & 63];
        out += alphabet[triple & 63];
    }
    if (i + 1 == bytes.size()) {
        uint32_t triple = bytes[i] << 16;
        out += alphabet[(triple >> 18) & 63];
        out += alphabet[(triple >> 12) & 63];
        out += "==";
    } else if (i + 2 == bytes.size()) {
        uint32_t triple = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += alphabet[(triple >> 18) & 63];
        out += alphabet[(triple >> 12) & 63];
        out += alphabet[(triple >> 6) & 63];
        out += '=';
    }
    return out;
}

// Test hosts run on little-endian machines
inline std::string encodeFloats(const std::vector<float>& values) {
    std::vector<uint8_t> bytes(values.size() * sizeof(float));
    if (!values.empty())
        std::memcpy(bytes.data(), values.data(), bytes.size());
    return encodeBase64(bytes);
}

inline std::vector<float> sequence(size_t length, float start = 0.0f) {
    std::vector<float> values(length);
    for (size_t i = 0; i < length; ++i)
        values[i] = start + static_cast<float>(i);
    return values;
}

// In-process host. Each request is answered on the poll after it was sent, by
// a handler that returns the response body ({"result": ...} or {"error": ...}).
class ScriptedTransport : public HostTransport {
public:
    using Handler = std::function<nlohmann::json(const std::string& method, const nlohmann::json& params)>;

    explicit ScriptedTransport(Handler handler) : handler(std::move(handler)) {}

    void sendLine(const std::string& line) override {
        if (closed)
            throw HostTransportError("host closed its input");
        nlohmann::json request = nlohmann::json::parse(line);
        requests.push_back(request);
        pending.push_back(request);
        maxOutstanding = std::max(maxOutstanding, static_cast<int>(pending.size()));
    }

    std::optional<std::string> pollLine() override {
        if (pending.empty())
            return std::nullopt;
        if (static_cast<int>(answered) >= closeAfterAnswers)
            throw HostTransportError("host exited");

        nlohmann::json request = pending.front();
        pending.pop_front();
        ++answered;

        nlohmann::json body = handler(request["method"].get<std::string>(), request["params"]);
        body["id"] = request["id"];
        return body.dump();
    }

    // Requests with the given method, in the order they were sent
    std::vector<nlohmann::json> requestsFor(const std::string& method) const {
        std::vector<nlohmann::json> matching;
        for (const nlohmann::json& request : requests)
            if (request["method"] == method)
                matching.push_back(request);
        return matching;
    }

    Handler handler;
    std::vector<nlohmann::json> requests;
    std::deque<nlohmann::json> pending;
    int maxOutstanding = 0;
    size_t answered = 0;
    int closeAfterAnswers = 1 << 30;
    bool closed = false;
};

// A trajectory held in memory, served the way a simulation host serves it
struct FakeTrajectory {
    nlohmann::json metadata;
    std::map<std::string, nlohmann::json> geometries;
    // geometry -> field -> full flat array
    std::map<std::string, std::map<std::string, std::vector<float>>> arrays;
    // Overrides for single requests: method + "/" + geometry + "." + field
    std::map<std::string, nlohmann::json> overrides;

    nlohmann::json respond(const std::string& method, const nlohmann::json& params) const {
        std::string key = method;
        if (params.contains("name"))
            key += "/" + params["name"].get<std::string>();
        if (params.contains("field"))
            key += "." + params["field"].get<std::string>();
        if (params.contains("frame_offset"))
            key += "@" + std::to_string(params["frame_offset"].get<int>());
        auto overridden = overrides.find(key);
        if (overridden != overrides.end())
            return overridden->second;

        if (method == "GetSimulationMetadata")
            return { { "result", metadata } };
        if (method == "GetGeometryMetadata") {
            auto it = geometries.find(params["name"].get<std::string>());
            if (it == geometries.end())
                return { { "error", "no such geometry" } };
            return { { "result", it->second } };
        }

        const std::vector<float>& data = arrays.at(params["name"].get<std::string>()).at(params["field"].get<std::string>());
        if (method == "GetArray")
            return { { "result", { { "array", encodeFloats(data) } } } };
        if (method == "GetArrayChunk") {
            size_t frameLength = data.size() / metadata["frame_count"].get<size_t>();
            size_t begin = frameLength * params["frame_offset"].get<size_t>();
            size_t end = begin + frameLength * params["frame_count"].get<size_t>();
            std::vector<float> chunk(data.begin() + begin, data.begin() + std::min(end, data.size()));
            return { { "result", { { "array_chunk", encodeFloats(chunk) } } } };
        }
        return { { "error", "unknown method " + method } };
    }
};

// Drives the loader the way the render loop does, one update per tick
inline int runToCompletion(ChunkedLoader& loader, int maxTicks = 10000) {
    int ticks = 0;
    while (!loader.isFinished() && ticks < maxTicks) {
        loader.update();
        ++ticks;
    }
    return ticks;
}

} // namespace testing_support
