#pragma once

#include "agentdispatch/types.hpp"

#include <functional>
#include <string>

namespace agentdispatch {

// Contract implemented by every worker agent. Instances are created once at
// startup and shared by reference with the executor and the pool manager.
class Agent {
public:
    Agent(AgentId id, AgentType type);
    virtual ~Agent() = default;

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const AgentId& id() const noexcept;
    AgentType type() const noexcept;

    virtual AgentResponse process_request(const AgentRequest& request) = 0;

    // Liveness probe used by the pool manager. Default: always healthy.
    virtual bool health_check();

protected:
    AgentResponse make_success(json result) const;
    AgentResponse make_error(std::string message) const;

private:
    AgentId   id_;
    AgentType type_;
};

// Agent backed by a callable; exceptions thrown by the callable propagate.
class FunctionAgent : public Agent {
public:
    using Handler = std::function<json(const AgentRequest&)>;
    using HealthProbe = std::function<bool()>;

    FunctionAgent(AgentId id, AgentType type, Handler handler,
                  HealthProbe probe = nullptr);

    AgentResponse process_request(const AgentRequest& request) override;
    bool health_check() override;

private:
    Handler handler_;
    HealthProbe probe_;
};

} // namespace agentdispatch
