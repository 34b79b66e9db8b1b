#pragma once
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "host_transport.h"

// The host answered a request with an error instead of a result
class HostError : public std::runtime_error
{
public:
    explicit HostError(const std::string& what) : std::runtime_error(what) {}
};

// Request/response client for the host RPC surface.
//
// The client owns a single in-flight slot: call() hands out a future for the
// response and refuses (std::logic_error) to start a second request until the
// first has been resolved by pump(). Callers therefore can never have more than
// one outstanding request to the host.
class HostClient
{
public:
    explicit HostClient(HostTransport& transport) : m_transport(transport) {}

    std::future<nlohmann::json> call(const std::string& method, nlohmann::json params = nlohmann::json::object());

    // Non-blocking. Moves a pending response (or failure) into the in-flight future.
    void pump();

    bool isBusy() const { return m_inFlight.has_value(); }
    int requestsCompleted() const { return m_completed; }

private:
    void resolve(const nlohmann::json& response);
    void fail(std::exception_ptr error);

    HostTransport& m_transport;
    std::optional<std::promise<nlohmann::json>> m_inFlight;
    int m_inFlightId = 0;
    int m_nextId = 1;
    int m_completed = 0;
};
