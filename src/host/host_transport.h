#pragma once
#include <optional>
#include <stdexcept>
#include <string>

class HostTransportError : public std::runtime_error
{
public:
    explicit HostTransportError(const std::string& what) : std::runtime_error(what) {}
};

// Line-oriented channel to the simulation host. One JSON document per line in
// each direction. Implementations must never block in pollLine().
class HostTransport
{
public:
    virtual ~HostTransport() = default;

    virtual void sendLine(const std::string& line) = 0;
    // Returns the next complete line once one has arrived, empty otherwise.
    // Throws HostTransportError when the host has gone away.
    virtual std::optional<std::string> pollLine() = 0;
};
