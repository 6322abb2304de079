#pragma once

#include <stdexcept>
#include <string>

namespace nodeos {

enum class ErrorKind {
    // Host reports something that should not happen on a running system
    // (no booted deployment, ambiguous repo refs). Never retried.
    HostState,
    // Network-bound command failed after its retry budget.
    TransientNetwork,
    // Operation is not available on this host variant.
    Unsupported,
    // Structured output from a host tool could not be decoded.
    Parse,
    // Wrapped external command exited non-zero or could not start.
    CommandFailed,
    Config
};

class NodeOsError : public std::runtime_error
{
public:
    NodeOsError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const noexcept
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

class CommandError : public NodeOsError
{
public:
    CommandError(ErrorKind kind,
                 const std::string &commandLine,
                 int exitCode,
                 const std::string &output,
                 const std::string &reason);

    const std::string &commandLine() const noexcept
    {
        return m_commandLine;
    }

    int exitCode() const noexcept
    {
        return m_exitCode;
    }

    const std::string &output() const noexcept
    {
        return m_output;
    }

private:
    std::string m_commandLine;
    int m_exitCode;
    std::string m_output;
};

class UnsupportedOperationError : public NodeOsError
{
public:
    UnsupportedOperationError()
        : NodeOsError(ErrorKind::Unsupported,
                      "operating system is not a CoreOS variant")
    {
    }
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::HostState:
        return "host_state";
    case ErrorKind::TransientNetwork:
        return "transient_network";
    case ErrorKind::Unsupported:
        return "unsupported";
    case ErrorKind::Parse:
        return "parse";
    case ErrorKind::CommandFailed:
        return "command_failed";
    case ErrorKind::Config:
        return "config";
    }
    return "unknown";
}

inline CommandError::CommandError(ErrorKind kind,
                                  const std::string &commandLine,
                                  int exitCode,
                                  const std::string &output,
                                  const std::string &reason)
    : NodeOsError(kind,
                  "error running " + commandLine + ": " + reason
                      + (output.empty() ? std::string() : ": " + output))
    , m_commandLine(commandLine)
    , m_exitCode(exitCode)
    , m_output(output)
{
}

} // namespace nodeos
