#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <cstddef>
#include <vector>

namespace agentdispatch {

using json = nlohmann::json;

// Identifiers
using AgentId = std::string;
using TaskId = std::string;
using RequestId = std::string;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Request priority (higher = more important)
using Priority = std::int32_t;

constexpr Priority PRIORITY_LOW      = 0;
constexpr Priority PRIORITY_NORMAL   = 50;
constexpr Priority PRIORITY_HIGH     = 100;
constexpr Priority PRIORITY_CRITICAL = 200;

// Worker agent categories. CodeSearch and Classification only exist in the pool.
enum class AgentType {
    Chat,
    SystemCommands,
    RAG,
    KnowledgeRetrieval,
    Research,
    Orchestrator,
    CodeSearch,
    Classification
};

enum class RoutingStrategy {
    SingleAgent,
    MultiAgent,
    OrchestratorAnalysis
};

enum class ResponseStatus {
    Success,
    Error
};

enum class HealthState {
    Healthy,
    Unhealthy
};

struct RoutingDecision {
    RoutingStrategy strategy{RoutingStrategy::SingleAgent};
    AgentType primary_agent{AgentType::Chat};
    std::vector<AgentType> secondary_agents;
    double confidence{0.0};
    std::string reasoning;
};

// Envelope sent to an agent
struct AgentRequest {
    RequestId request_id;
    AgentType agent_type{AgentType::Chat};
    std::string action;
    json payload = json::object();
    Priority priority{PRIORITY_NORMAL};
};

// Envelope returned by an agent
struct AgentResponse {
    ResponseStatus status{ResponseStatus::Success};
    json result;
    std::optional<std::string> error;
    AgentId agent_id;
    AgentType agent_type{AgentType::Chat};
};

struct ChatMessage {
    std::string role;
    std::string content;
};

// What both executor entry points hand back to the caller
struct ExecutionResponse {
    ResponseStatus status{ResponseStatus::Success};
    std::string content;
    std::string routing_strategy;
    std::optional<RoutingDecision> routing_decision;
    std::vector<AgentType> agents_used;
    std::vector<std::string> secondary_results;
    json result;
    std::string error;
    std::optional<AgentId> agent_id;
    std::optional<TaskId> task_id;
    std::optional<double> execution_time;  // seconds
    bool synthesized{false};

    bool ok() const noexcept { return status == ResponseStatus::Success; }
};

// A dispatch currently running on a pooled agent
struct TaskEntry {
    TaskId task_id;
    AgentId agent_id;
    Timestamp start_time{};
};

// Snapshot of one pooled agent for monitoring
struct PoolAgentSnapshot {
    AgentId agent_id;
    AgentType agent_type{AgentType::Chat};
    HealthState health{HealthState::Healthy};
    std::size_t active_tasks{0};
};

// Pool-wide snapshot for monitoring
struct PoolSnapshot {
    Timestamp timestamp{};
    std::vector<PoolAgentSnapshot> agents;
    std::size_t healthy_agents{0};
    std::size_t unhealthy_agents{0};
    std::size_t total_active_tasks{0};
};

inline const char* to_string(AgentType t) {
    switch (t) {
        case AgentType::Chat:               return "chat";
        case AgentType::SystemCommands:     return "system_commands";
        case AgentType::RAG:                return "rag";
        case AgentType::KnowledgeRetrieval: return "knowledge_retrieval";
        case AgentType::Research:           return "research";
        case AgentType::Orchestrator:       return "orchestrator";
        case AgentType::CodeSearch:         return "code_search";
        case AgentType::Classification:     return "classification";
    }
    return "unknown";
}

inline const char* to_string(RoutingStrategy s) {
    switch (s) {
        case RoutingStrategy::SingleAgent:          return "single_agent";
        case RoutingStrategy::MultiAgent:           return "multi_agent";
        case RoutingStrategy::OrchestratorAnalysis: return "orchestrator_analysis";
    }
    return "unknown";
}

inline const char* to_string(ResponseStatus s) {
    switch (s) {
        case ResponseStatus::Success: return "success";
        case ResponseStatus::Error:   return "error";
    }
    return "unknown";
}

inline const char* to_string(HealthState h) {
    switch (h) {
        case HealthState::Healthy:   return "healthy";
        case HealthState::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

// Case-insensitive; accepts canonical names ("knowledge_retrieval") and
// enum-style names ("KNOWLEDGE_RETRIEVAL").
std::optional<AgentType> parse_agent_type(const std::string& name);
std::optional<RoutingStrategy> parse_routing_strategy(const std::string& name);

// All agent types, in declaration order
const std::vector<AgentType>& all_agent_types();

} // namespace agentdispatch
