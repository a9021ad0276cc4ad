#include "agentdispatch/types.hpp"

#include "text_util.hpp"

#include <algorithm>

namespace agentdispatch {

const std::vector<AgentType>& all_agent_types() {
    static const std::vector<AgentType> types = {
        AgentType::Chat,
        AgentType::SystemCommands,
        AgentType::RAG,
        AgentType::KnowledgeRetrieval,
        AgentType::Research,
        AgentType::Orchestrator,
        AgentType::CodeSearch,
        AgentType::Classification,
    };
    return types;
}

std::optional<AgentType> parse_agent_type(const std::string& name) {
    std::string key = detail::to_lower(detail::trim(name));
    std::replace(key.begin(), key.end(), '-', '_');
    // Deployed name of the NPU-backed code search worker
    if (key == "npu_code_search") return AgentType::CodeSearch;
    for (AgentType t : all_agent_types()) {
        if (key == to_string(t)) return t;
    }
    return std::nullopt;
}

std::optional<RoutingStrategy> parse_routing_strategy(const std::string& name) {
    std::string key = detail::to_lower(detail::trim(name));
    std::replace(key.begin(), key.end(), '-', '_');
    for (RoutingStrategy s : {RoutingStrategy::SingleAgent,
                              RoutingStrategy::MultiAgent,
                              RoutingStrategy::OrchestratorAnalysis}) {
        if (key == to_string(s)) return s;
    }
    return std::nullopt;
}

} // namespace agentdispatch
