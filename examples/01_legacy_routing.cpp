// 01_legacy_routing.cpp
//
// Keyword routing and legacy execution with in-process agents.
//
// Scenario:
//   - Five local agents (chat, system commands, RAG, knowledge retrieval,
//     research) are plain FunctionAgents that echo what they were asked.
//   - No LLM client is configured, so every request is routed by the
//     keyword fast path.
//   - A research question fans out to the RAG agent and the two answers
//     are synthesized into one response.
//   - A long, unmatched request goes to the orchestrator fallback.

#include <agentdispatch/agentdispatch.hpp>

#include <iostream>
#include <memory>
#include <string>

using namespace agentdispatch;

namespace {

std::shared_ptr<Agent> echo_agent(const std::string& id, AgentType type) {
    return std::make_shared<FunctionAgent>(id, type, [id](const AgentRequest& req) {
        return json{{"response", "[" + id + "] " + req.payload.value("request", "")}};
    });
}

void print_response(const std::string& request, const ExecutionResponse& r) {
    std::cout << "> " << request << "\n";
    std::cout << "  status:   " << to_string(r.status) << "\n";
    std::cout << "  strategy: " << r.routing_strategy << "\n";
    if (r.routing_decision) {
        std::cout << "  primary:  " << to_string(r.routing_decision->primary_agent)
                  << " (confidence " << r.routing_decision->confidence << ")\n";
    }
    std::cout << "  content:  " << r.content << "\n\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== AgentDispatch: Legacy Routing Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Build the router with the built-in capability descriptors.
    // ----------------------------------------------------------------
    auto router = std::make_shared<Router>();
    std::cout << router->capabilities().describe_all() << "\n";

    // ----------------------------------------------------------------
    // 2. Wire the local agents and an orchestrator fallback.
    // ----------------------------------------------------------------
    LocalAgents local;
    local.chat                = echo_agent("chat", AgentType::Chat);
    local.system_commands     = echo_agent("system", AgentType::SystemCommands);
    local.rag                 = echo_agent("rag", AgentType::RAG);
    local.knowledge_retrieval = echo_agent("kb", AgentType::KnowledgeRetrieval);
    local.research            = echo_agent("research", AgentType::Research);

    auto orchestrator = echo_agent("orchestrator", AgentType::Orchestrator);
    auto fallback = std::make_shared<AgentFallbackHandler>(orchestrator);

    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    composite->add_monitor(metrics);
    router->set_monitor(composite);

    Executor executor(router, local, fallback);
    executor.set_monitor(composite);

    // ----------------------------------------------------------------
    // 3. Route a handful of requests.
    // ----------------------------------------------------------------
    const std::string requests[] = {
        "hello there",
        "run command ls -la in the project directory",
        "research the latest developments in battery chemistry",
        "search the knowledge base for the deployment guide",
        "I have a long and rather involved question that does not fit any of "
        "the usual categories and needs some planning across several steps",
    };

    for (const auto& request : requests) {
        print_response(request, executor.execute_legacy(request));
    }

    // ----------------------------------------------------------------
    // 4. Summarize what the monitor observed.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "=== Metrics ===\n";
    std::cout << "Classified requests: " << m.classified_requests << "\n";
    std::cout << "Fast path routes:    " << m.fast_path_routes << "\n";
    std::cout << "Agent invocations:   " << m.agent_invocations << "\n";
    std::cout << "Fallbacks:           " << m.fallbacks << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
