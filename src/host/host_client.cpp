#include "host_client.h"
#include <utility>

std::future<nlohmann::json> HostClient::call(const std::string& method, nlohmann::json params)
{
    if (m_inFlight)
        throw std::logic_error("HostClient: '" + method + "' requested while request " + std::to_string(m_inFlightId) + " is still outstanding");

    nlohmann::json request = {
        { "id", m_nextId },
        { "method", method },
        { "params", std::move(params) },
    };

    m_inFlight.emplace();
    m_inFlightId = m_nextId++;
    std::future<nlohmann::json> response = m_inFlight->get_future();

    try
    {
        m_transport.sendLine(request.dump());
    }
    catch (const HostTransportError&)
    {
        fail(std::current_exception());
    }
    return response;
}

void HostClient::pump()
{
    if (!m_inFlight)
        return;

    std::optional<std::string> line;
    try
    {
        line = m_transport.pollLine();
    }
    catch (const HostTransportError&)
    {
        fail(std::current_exception());
        return;
    }
    if (!line)
        return;

    nlohmann::json response;
    try
    {
        response = nlohmann::json::parse(*line);
    }
    catch (const nlohmann::json::parse_error&)
    {
        fail(std::current_exception());
        return;
    }
    resolve(response);
}

void HostClient::resolve(const nlohmann::json& response)
{
    if (!response.is_object() || response.value("id", -1) != m_inFlightId)
    {
        fail(std::make_exception_ptr(HostError("response does not answer request " + std::to_string(m_inFlightId))));
        return;
    }
    if (response.contains("error"))
    {
        const nlohmann::json& error = response["error"];
        fail(std::make_exception_ptr(HostError(error.is_string() ? error.get<std::string>() : error.dump())));
        return;
    }

    std::promise<nlohmann::json> promise = std::move(*m_inFlight);
    m_inFlight.reset();
    ++m_completed;
    promise.set_value(response.contains("result") ? response["result"] : nlohmann::json::object());
}

void HostClient::fail(std::exception_ptr error)
{
    std::promise<nlohmann::json> promise = std::move(*m_inFlight);
    m_inFlight.reset();
    ++m_completed;
    promise.set_exception(error);
}
