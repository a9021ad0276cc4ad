#pragma once

#include "agentdispatch/types.hpp"
#include "agentdispatch/capability.hpp"
#include "agentdispatch/config.hpp"
#include "agentdispatch/llm_client.hpp"
#include "agentdispatch/monitor.hpp"
#include "agentdispatch/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace agentdispatch {

// Turns a free-text request into a RoutingDecision.
//
// A deterministic keyword pass runs first; when its confidence does not clear
// RouterConfig::fast_path_threshold and an LLM client is configured, the LLM
// classifier is consulted. Any classifier failure falls back to the keyword
// decision, so classify() never fails. Stateless after construction and safe
// to share between threads.
class Router {
public:
    explicit Router(CapabilityRegistry capabilities = CapabilityRegistry{},
                    std::shared_ptr<LlmClient> llm_client = nullptr,
                    RouterConfig config = RouterConfig{});

    RoutingDecision classify(const std::string& request,
                             const json& context = json::object()) const;

    // Keyword pass. Checks run in a fixed order: greeting, system command,
    // research, knowledge; the first category that matches wins.
    RoutingDecision quick_route_analysis(const std::string& request) const;

    // Validate LLM output (JSON object, possibly wrapped in prose)
    Result<RoutingDecision> parse_classification(const std::string& llm_text) const;

    std::string build_classification_prompt(const std::string& request,
                                            const json& context) const;

    static std::string adapt_request_for_secondary(const std::string& original,
                                                   const std::string& primary_result,
                                                   AgentType secondary_type);

    const CapabilityRegistry& capabilities() const noexcept;
    const RouterConfig& config() const noexcept;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    CapabilityRegistry capabilities_;
    std::shared_ptr<LlmClient> llm_client_;
    RouterConfig config_;
    std::shared_ptr<Monitor> monitor_;

    std::optional<RoutingDecision> classify_with_llm(const std::string& request,
                                                     const json& context) const;
    void emit_event(EventType type, const std::string& message,
                    const RoutingDecision* decision = nullptr,
                    std::optional<double> duration_ms = std::nullopt) const;
};

} // namespace agentdispatch
