#pragma once
#include <stdexcept>
#include <string>

namespace agentpool {

// Base for every failure the core reports by exception
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Agent process exited before becoming healthy, or the health check timed out
class StartupFailure : public Error {
public:
    using Error::Error;
};

// Port pool exhausted
class CapacityExceeded : public Error {
public:
    using Error::Error;
};

// Agent configuration could not be written into the worktree
class ConfigWriteFailure : public Error {
public:
    using Error::Error;
};

// Worktree missing or executable not spawnable
class PreflightFailure : public Error {
public:
    using Error::Error;
};

// Transport failure or non-2xx response from an agent's HTTP API
class AgentApiError : public Error {
public:
    AgentApiError(const std::string& what, int status = 0)
        : Error(what), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// Operation not valid in the current state (no server, no session, unknown item)
class InvalidOperation : public Error {
public:
    using Error::Error;
};

// Unknown project or work item, or no agent running for one
class NotFound : public InvalidOperation {
public:
    using InvalidOperation::InvalidOperation;
};

} // namespace agentpool
