#pragma once
#include <string>
#include <vector>
#include <sys/types.h>
#include "host_transport.h"

// Runs the host as a child process and talks to it over its stdin/stdout.
// Reads are non-blocking so the render loop can poll every frame.
class PipeHostTransport : public HostTransport
{
public:
    // argv[0] is looked up on PATH. Throws HostTransportError when the process
    // cannot be started.
    explicit PipeHostTransport(const std::vector<std::string>& command);
    ~PipeHostTransport() override;

    PipeHostTransport(const PipeHostTransport&) = delete;
    PipeHostTransport& operator=(const PipeHostTransport&) = delete;

    void sendLine(const std::string& line) override;
    std::optional<std::string> pollLine() override;

private:
    void shutdown();

    pid_t m_pid = -1;
    int m_toHost = -1;
    int m_fromHost = -1;
    bool m_closed = false;
    std::string m_readBuffer;
};
