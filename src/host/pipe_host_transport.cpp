#include "pipe_host_transport.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

PipeHostTransport::PipeHostTransport(const std::vector<std::string>& command)
{
    if (command.empty())
        throw HostTransportError("no host command given");

    // A host that dies mid-write must surface as an error return, not kill the viewer
    std::signal(SIGPIPE, SIG_IGN);

    int toHost[2];
    int fromHost[2];
    if (pipe(toHost) != 0)
        throw HostTransportError(std::string("pipe: ") + std::strerror(errno));
    if (pipe(fromHost) != 0)
    {
        close(toHost[0]);
        close(toHost[1]);
        throw HostTransportError(std::string("pipe: ") + std::strerror(errno));
    }

    m_pid = fork();
    if (m_pid < 0)
    {
        int error = errno;
        close(toHost[0]);
        close(toHost[1]);
        close(fromHost[0]);
        close(fromHost[1]);
        throw HostTransportError(std::string("fork: ") + std::strerror(error));
    }

    if (m_pid == 0)
    {
        dup2(toHost[0], STDIN_FILENO);
        dup2(fromHost[1], STDOUT_FILENO);
        close(toHost[0]);
        close(toHost[1]);
        close(fromHost[0]);
        close(fromHost[1]);

        std::vector<char*> argv;
        for (const std::string& arg : command)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        std::cerr << "PipeHostTransport: failed to start '" << command[0] << "': " << std::strerror(errno) << "\n";
        _exit(127);
    }

    close(toHost[0]);
    close(fromHost[1]);
    m_toHost = toHost[1];
    m_fromHost = fromHost[0];

    int flags = fcntl(m_fromHost, F_GETFL, 0);
    fcntl(m_fromHost, F_SETFL, flags | O_NONBLOCK);

    std::cout << "PipeHostTransport: started host '" << command[0] << "' (pid " << m_pid << ")\n";
}

PipeHostTransport::~PipeHostTransport()
{
    shutdown();
}

void PipeHostTransport::sendLine(const std::string& line)
{
    if (m_closed)
        throw HostTransportError("host connection is closed");

    std::string payload = line + "\n";
    size_t written = 0;
    while (written < payload.size())
    {
        ssize_t result = write(m_toHost, payload.data() + written, payload.size() - written);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            m_closed = true;
            throw HostTransportError(std::string("write to host failed: ") + std::strerror(errno));
        }
        written += static_cast<size_t>(result);
    }
}

std::optional<std::string> PipeHostTransport::pollLine()
{
    char chunk[65536];
    while (!m_closed)
    {
        ssize_t result = read(m_fromHost, chunk, sizeof(chunk));
        if (result > 0)
        {
            m_readBuffer.append(chunk, static_cast<size_t>(result));
            continue;
        }
        if (result == 0)
        {
            m_closed = true;
            break;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;
        m_closed = true;
        throw HostTransportError(std::string("read from host failed: ") + std::strerror(errno));
    }

    size_t newline = m_readBuffer.find('\n');
    if (newline != std::string::npos)
    {
        std::string line = m_readBuffer.substr(0, newline);
        m_readBuffer.erase(0, newline + 1);
        return line;
    }
    if (m_closed)
        throw HostTransportError("host closed its output");
    return std::nullopt;
}

void PipeHostTransport::shutdown()
{
    if (m_toHost >= 0)
    {
        close(m_toHost);
        m_toHost = -1;
    }
    if (m_fromHost >= 0)
    {
        close(m_fromHost);
        m_fromHost = -1;
    }
    if (m_pid > 0)
    {
        // Closing stdin is the polite request to exit; a host that ignores it is stopped
        int status = 0;
        if (waitpid(m_pid, &status, WNOHANG) == 0)
        {
            kill(m_pid, SIGTERM);
            waitpid(m_pid, &status, 0);
        }
        m_pid = -1;
    }
    m_closed = true;
}
