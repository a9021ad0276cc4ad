// 03_llm_classification.cpp
//
// Router classification backed by an LLM client.
//
// Scenario:
//   - A canned LlmClient stands in for a real inference server and answers
//     with a chat-completion shaped JSON document.
//   - Requests with a confident keyword match never reach the LLM.
//   - Ambiguous requests are classified by the LLM, which may choose a
//     multi-agent strategy.
//   - A malformed LLM answer falls back to the keyword decision.

#include <agentdispatch/agentdispatch.hpp>

#include <iostream>
#include <string>

using namespace agentdispatch;

namespace {

// Answers every prompt with a fixed assistant message
class CannedLlmClient : public LlmClient {
public:
    explicit CannedLlmClient(std::string content) : content_(std::move(content)) {}

    json chat_completion(const std::vector<ChatMessage>& messages,
                         const std::string& llm_type,
                         double /*temperature*/,
                         int /*max_tokens*/,
                         double /*top_p*/) override {
        std::cout << "  (LLM '" << llm_type << "' called with "
                  << messages.size() << " messages)\n";
        return json{{"choices", json::array({json{{"message", {{"content", content_}}}}})}};
    }

private:
    std::string content_;
};

void show(const Router& router, const std::string& request) {
    std::cout << "> " << request << "\n";
    auto d = router.classify(request);
    std::cout << "  " << to_string(d.strategy) << " -> " << to_string(d.primary_agent);
    for (auto t : d.secondary_agents) {
        std::cout << " + " << to_string(t);
    }
    std::cout << " (" << d.confidence << ") " << d.reasoning << "\n\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== AgentDispatch: LLM Classification Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. A router whose LLM answers with a multi-agent plan.
    // ----------------------------------------------------------------
    auto planner = std::make_shared<CannedLlmClient>(
        "Here is my decision:\n"
        "{\"strategy\": \"multi_agent\", \"primary_agent\": \"research\", "
        "\"secondary_agents\": [\"rag\"], \"confidence\": 0.9, "
        "\"reasoning\": \"needs fresh sources and a synthesized answer\"}");

    RouterConfig config;
    config.fast_path_threshold = 0.8;
    Router router(CapabilityRegistry{}, planner, config);
    router.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    show(router, "hi");
    show(router, "compare the trade-offs of the three storage engines we evaluated last "
                 "quarter and tell me which one suits the new ingestion service");

    // ----------------------------------------------------------------
    // 2. The same request with an LLM that answers nonsense.
    // ----------------------------------------------------------------
    Router confused(CapabilityRegistry{}, std::make_shared<CannedLlmClient>("no idea, sorry"));
    show(confused, "compare the trade-offs of the three storage engines we evaluated last "
                   "quarter and tell me which one suits the new ingestion service");

    // ----------------------------------------------------------------
    // 3. Inspect the prompt the classifier sends.
    // ----------------------------------------------------------------
    std::cout << "=== Classification prompt ===\n";
    std::cout << router.build_classification_prompt("what's the weather like?",
                                                    json{{"user", "demo"}})
              << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
