#pragma once

#include "agentdispatch/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentdispatch {

// Static description of what one agent type is good at
struct AgentCapability {
    AgentType agent_type{AgentType::Chat};
    std::string model_size;
    std::string specialization;
    std::vector<std::string> strengths;
    std::vector<std::string> limitations;
    std::string resource_usage;
};

// Read-only registry of capability descriptors, built once at startup.
class CapabilityRegistry {
public:
    // Registry holding the built-in descriptors for every AgentType
    CapabilityRegistry();

    // Registry holding exactly the given descriptors (later duplicates win)
    explicit CapabilityRegistry(std::vector<AgentCapability> capabilities);

    std::optional<AgentCapability> get(AgentType type) const;
    bool has(AgentType type) const;

    // Descriptors ordered by AgentType declaration order
    std::vector<AgentCapability> all() const;
    std::size_t size() const noexcept;

    // Types whose strengths mention the given phrase (case-insensitive)
    std::vector<AgentType> types_with_strength(const std::string& phrase) const;

    // Multi-line human readable block, used for the classifier prompt
    std::string describe(AgentType type) const;
    std::string describe_all() const;

    static std::vector<AgentCapability> default_capabilities();

private:
    std::map<AgentType, AgentCapability> capabilities_;
};

} // namespace agentdispatch
