#include "agentdispatch/capability.hpp"

#include "text_util.hpp"

#include <sstream>

namespace agentdispatch {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // anonymous namespace

CapabilityRegistry::CapabilityRegistry()
    : CapabilityRegistry(default_capabilities())
{}

CapabilityRegistry::CapabilityRegistry(std::vector<AgentCapability> capabilities) {
    for (auto& cap : capabilities) {
        AgentType type = cap.agent_type;
        capabilities_[type] = std::move(cap);
    }
}

std::optional<AgentCapability> CapabilityRegistry::get(AgentType type) const {
    auto it = capabilities_.find(type);
    if (it == capabilities_.end()) return std::nullopt;
    return it->second;
}

bool CapabilityRegistry::has(AgentType type) const {
    return capabilities_.count(type) > 0;
}

std::vector<AgentCapability> CapabilityRegistry::all() const {
    std::vector<AgentCapability> result;
    result.reserve(capabilities_.size());
    for (auto& [_, cap] : capabilities_) {
        result.push_back(cap);
    }
    return result;
}

std::size_t CapabilityRegistry::size() const noexcept {
    return capabilities_.size();
}

std::vector<AgentType> CapabilityRegistry::types_with_strength(const std::string& phrase) const {
    std::string needle = detail::to_lower(phrase);
    std::vector<AgentType> result;
    for (auto& [type, cap] : capabilities_) {
        for (auto& strength : cap.strengths) {
            if (detail::contains(detail::to_lower(strength), needle)) {
                result.push_back(type);
                break;
            }
        }
    }
    return result;
}

std::string CapabilityRegistry::describe(AgentType type) const {
    auto it = capabilities_.find(type);
    if (it == capabilities_.end()) return "";

    const auto& cap = it->second;
    std::ostringstream out;
    out << to_string(type) << " (" << cap.model_size << " model, "
        << cap.resource_usage << " resource usage)\n"
        << "  Specialization: " << cap.specialization << "\n"
        << "  Strengths: " << join(cap.strengths, ", ") << "\n"
        << "  Limitations: " << join(cap.limitations, ", ") << "\n";
    return out.str();
}

std::string CapabilityRegistry::describe_all() const {
    std::string out;
    for (auto& [type, _] : capabilities_) {
        out += describe(type);
    }
    return out;
}

std::vector<AgentCapability> CapabilityRegistry::default_capabilities() {
    return {
        {AgentType::Chat, "1B",
         "Conversational interactions, greetings and simple questions",
         {"greetings", "small talk", "quick factual answers", "clarifying questions"},
         {"no system access", "no document retrieval", "shallow reasoning"},
         "low"},
        {AgentType::SystemCommands, "3B",
         "Generating and explaining shell commands for system tasks",
         {"command generation", "system administration", "file operations",
          "process and disk inspection"},
         {"cannot answer general knowledge questions", "commands require validation"},
         "medium"},
        {AgentType::RAG, "3B",
         "Synthesizing answers from retrieved documents",
         {"document synthesis", "multi-source summarization", "grounded answers"},
         {"depends on retrieved context", "slower than direct chat"},
         "high"},
        {AgentType::KnowledgeRetrieval, "1B",
         "Fast semantic lookup in the knowledge base",
         {"semantic search", "fact lookup", "documentation retrieval"},
         {"returns raw passages", "no synthesis"},
         "low"},
        {AgentType::Research, "3B",
         "Web research for current or external information",
         {"web research", "current events", "fact checking", "source gathering"},
         {"requires network access", "slow", "results need synthesis"},
         "high"},
        {AgentType::Orchestrator, "3B",
         "Planning and coordinating complex multi-step requests",
         {"task decomposition", "complex reasoning", "workflow planning"},
         {"highest latency", "most expensive"},
         "high"},
        {AgentType::CodeSearch, "NPU",
         "Semantic search over the indexed codebase",
         {"code search", "function lookup", "symbol location"},
         {"only covers indexed repositories"},
         "medium"},
        {AgentType::Classification, "1B",
         "Classifying requests by intent and complexity",
         {"intent detection", "request classification", "complexity assessment"},
         {"does not answer requests"},
         "low"},
    };
}

} // namespace agentdispatch
