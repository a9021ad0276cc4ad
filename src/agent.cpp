#include "agentdispatch/agent.hpp"
#include "agentdispatch/exceptions.hpp"

namespace agentdispatch {

Agent::Agent(AgentId id, AgentType type)
    : id_(std::move(id))
    , type_(type)
{
    if (id_.empty()) {
        throw InvalidAgentException("Agent id must not be empty");
    }
}

const AgentId& Agent::id() const noexcept { return id_; }
AgentType Agent::type() const noexcept { return type_; }

bool Agent::health_check() { return true; }

AgentResponse Agent::make_success(json result) const {
    AgentResponse response;
    response.status = ResponseStatus::Success;
    response.result = std::move(result);
    response.agent_id = id_;
    response.agent_type = type_;
    return response;
}

AgentResponse Agent::make_error(std::string message) const {
    AgentResponse response;
    response.status = ResponseStatus::Error;
    response.error = std::move(message);
    response.agent_id = id_;
    response.agent_type = type_;
    return response;
}

// ========== FunctionAgent ==========

FunctionAgent::FunctionAgent(AgentId id, AgentType type, Handler handler, HealthProbe probe)
    : Agent(std::move(id), type)
    , handler_(std::move(handler))
    , probe_(std::move(probe))
{
    if (!handler_) {
        throw InvalidAgentException("FunctionAgent requires a handler");
    }
}

AgentResponse FunctionAgent::process_request(const AgentRequest& request) {
    return make_success(handler_(request));
}

bool FunctionAgent::health_check() {
    return probe_ ? probe_() : true;
}

} // namespace agentdispatch
