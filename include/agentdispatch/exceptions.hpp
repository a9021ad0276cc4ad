#pragma once

#include "agentdispatch/types.hpp"
#include <stdexcept>
#include <string>

namespace agentdispatch {

class AgentDispatchException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AgentNotFoundException : public AgentDispatchException {
public:
    explicit AgentNotFoundException(const AgentId& id)
        : AgentDispatchException("Agent not found: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class AgentAlreadyRegisteredException : public AgentDispatchException {
public:
    explicit AgentAlreadyRegisteredException(const AgentId& id)
        : AgentDispatchException("Agent already registered: " + id)
        , agent_id_(id) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class InvalidAgentException : public AgentDispatchException {
public:
    using AgentDispatchException::AgentDispatchException;
};

class ConfigException : public AgentDispatchException {
public:
    using AgentDispatchException::AgentDispatchException;
};

// Raised by LLM client implementations when the provider call fails
class LlmClientException : public AgentDispatchException {
public:
    using AgentDispatchException::AgentDispatchException;
};

} // namespace agentdispatch
