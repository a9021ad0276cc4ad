#pragma once

#include "agentdispatch/types.hpp"
#include "agentdispatch/agent.hpp"
#include "agentdispatch/agent_pool.hpp"
#include "agentdispatch/config.hpp"
#include "agentdispatch/monitor.hpp"
#include "agentdispatch/result.hpp"
#include "agentdispatch/router.hpp"

#include <memory>
#include <string>
#include <vector>

namespace agentdispatch {

// Strategy tags carried in ExecutionResponse::routing_strategy
namespace strategy_tag {
constexpr const char* SINGLE_AGENT          = "single_agent";
constexpr const char* SINGLE_AGENT_ERROR    = "single_agent_error";
constexpr const char* MULTI_AGENT           = "multi_agent";
constexpr const char* MULTI_AGENT_ERROR     = "multi_agent_error";
constexpr const char* ORCHESTRATOR_FALLBACK = "orchestrator_fallback";
constexpr const char* FINAL_FALLBACK        = "final_fallback";
constexpr const char* DISTRIBUTED           = "distributed";
constexpr const char* DISTRIBUTED_ERROR     = "distributed_error";
} // namespace strategy_tag

// In-process agents used by legacy execution. Any slot may be empty.
struct LocalAgents {
    std::shared_ptr<Agent> chat;
    std::shared_ptr<Agent> system_commands;
    std::shared_ptr<Agent> rag;
    std::shared_ptr<Agent> knowledge_retrieval;
    std::shared_ptr<Agent> research;

    // nullptr for types without a local slot
    std::shared_ptr<Agent> handler_for(AgentType type) const;
};

// Terminal handler for requests the router could not place
class FallbackHandler {
public:
    virtual ~FallbackHandler() = default;

    virtual ExecutionResponse handle(const std::string& request,
                                     const json& context,
                                     const std::vector<ChatMessage>& chat_history) = 0;
};

// Forwards fallback requests to an Orchestrator agent.
// Throws AgentDispatchException when the agent reports an error.
class AgentFallbackHandler : public FallbackHandler {
public:
    explicit AgentFallbackHandler(std::shared_ptr<Agent> orchestrator);

    ExecutionResponse handle(const std::string& request,
                             const json& context,
                             const std::vector<ChatMessage>& chat_history) override;

private:
    std::shared_ptr<Agent> orchestrator_;
};

// Plain text of an agent result: a string result as is, otherwise the first
// string field among response/content/text/answer/result, otherwise JSON.
std::string extract_agent_text(const json& result);

class Executor {
public:
    Executor(std::shared_ptr<const Router> router,
             LocalAgents local_agents,
             std::shared_ptr<FallbackHandler> fallback,
             std::shared_ptr<AgentPoolManager> pool = nullptr,
             ExecutorConfig config = ExecutorConfig{});

    // ==================== Legacy mode ====================

    ExecutionResponse execute_legacy(const std::string& request,
                                     const json& context = json::object(),
                                     const std::vector<ChatMessage>& chat_history = {});

    // Primary text plus an additional-information section of the secondary texts
    Result<std::string> synthesize(const std::string& primary,
                                   const std::vector<std::string>& secondaries) const;

    // ==================== Distributed mode ====================

    ExecutionResponse execute_distributed(const std::string& request,
                                          const json& context = json::object(),
                                          const std::vector<std::string>& preferred_agents = {});

    // Selection order: content affinity, caller preference, least loaded.
    // Only healthy agents are considered.
    Result<std::shared_ptr<Agent>> select_agent(
        const std::string& request,
        const std::vector<std::string>& preferred_agents = {}) const;

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);
    const ExecutorConfig& config() const noexcept;

private:
    std::shared_ptr<const Router> router_;
    LocalAgents local_agents_;
    std::shared_ptr<FallbackHandler> fallback_;
    std::shared_ptr<AgentPoolManager> pool_;
    ExecutorConfig config_;
    std::shared_ptr<Monitor> monitor_;

    ExecutionResponse run_single_agent(const RoutingDecision& decision,
                                       const std::string& request,
                                       const json& context,
                                       const std::vector<ChatMessage>& chat_history);
    ExecutionResponse run_multi_agent(const RoutingDecision& decision,
                                      const std::string& request,
                                      const json& context,
                                      const std::vector<ChatMessage>& chat_history);
    ExecutionResponse run_fallback(const RoutingDecision& decision,
                                   const std::string& request,
                                   const json& context,
                                   const std::vector<ChatMessage>& chat_history);

    Result<AgentResponse> invoke_local(AgentType type,
                                       const std::string& request,
                                       const json& context,
                                       const std::vector<ChatMessage>& chat_history);

    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<AgentType> agent_type = std::nullopt,
                    std::optional<TaskId> task_id = std::nullopt,
                    std::optional<double> duration_ms = std::nullopt) const;
};

} // namespace agentdispatch
