#include <gtest/gtest.h>
#include <agentdispatch/agentdispatch.hpp>

using namespace agentdispatch;

namespace {

// ===========================================================================
// Test doubles
// ===========================================================================

class ScriptedLlmClient : public LlmClient {
public:
    explicit ScriptedLlmClient(std::string reply) : reply_(std::move(reply)) {}

    json chat_completion(const std::vector<ChatMessage>&, const std::string&,
                         double, int, double) override {
        return reply_;
    }

private:
    std::string reply_;
};

class RecordingMonitor : public Monitor {
public:
    std::vector<MonitorEvent> events;

    void on_event(const MonitorEvent& event) override { events.push_back(event); }
    void on_snapshot(const PoolSnapshot&) override {}

    int count(EventType type) const {
        int n = 0;
        for (auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }
};

// Records the requests it receives and answers with a fixed text
class RecordingAgent : public Agent {
public:
    RecordingAgent(AgentId id, AgentType type, std::string answer)
        : Agent(std::move(id), type), answer_(std::move(answer)) {}

    AgentResponse process_request(const AgentRequest& request) override {
        requests.push_back(request);
        return make_success(json{{"response", answer_}});
    }

    std::vector<AgentRequest> requests;

private:
    std::string answer_;
};

class ThrowingAgent : public Agent {
public:
    ThrowingAgent(AgentId id, AgentType type) : Agent(std::move(id), type) {}

    AgentResponse process_request(const AgentRequest&) override {
        throw std::runtime_error("model unavailable");
    }
};

class ErrorAgent : public Agent {
public:
    ErrorAgent(AgentId id, AgentType type) : Agent(std::move(id), type) {}

    AgentResponse process_request(const AgentRequest&) override {
        return make_error("quota exceeded");
    }
};

class StaticFallback : public FallbackHandler {
public:
    int calls = 0;
    bool fail = false;
    bool fail_unknown = false;

    ExecutionResponse handle(const std::string& request, const json&,
                             const std::vector<ChatMessage>&) override {
        ++calls;
        if (fail) throw std::runtime_error("orchestrator down");
        if (fail_unknown) throw 7;
        ExecutionResponse r;
        r.content = "planned: " + request;
        return r;
    }
};

} // anonymous namespace

namespace {

const char* LONG_UNMATCHED =
    "plan a three day trip across the mountains with my family next month please";

// Answers with a JSON object holding bytes that are not valid UTF-8
std::shared_ptr<Agent> binary_agent(const AgentId& id, AgentType type) {
    return std::make_shared<FunctionAgent>(id, type, [](const AgentRequest&) {
        return json{{"blob", std::string("\xff\xfe")}};
    });
}

std::shared_ptr<Router> router_with_llm(const std::string& reply) {
    return std::make_shared<Router>(CapabilityRegistry{},
                                    std::make_shared<ScriptedLlmClient>(reply));
}

} // anonymous namespace

// ===========================================================================
// Fixture: all five local agents answer successfully
// ===========================================================================

class LegacyExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingAgent> chat =
        std::make_shared<RecordingAgent>("chat", AgentType::Chat, "Hello! How can I help?");
    std::shared_ptr<RecordingAgent> system_commands =
        std::make_shared<RecordingAgent>("sys", AgentType::SystemCommands, "df -h");
    std::shared_ptr<RecordingAgent> rag =
        std::make_shared<RecordingAgent>("rag", AgentType::RAG, "Synthesized summary.");
    std::shared_ptr<RecordingAgent> knowledge =
        std::make_shared<RecordingAgent>("kb", AgentType::KnowledgeRetrieval, "Policy: 30 days.");
    std::shared_ptr<RecordingAgent> research =
        std::make_shared<RecordingAgent>("web", AgentType::Research, "Fusion news.");
    std::shared_ptr<StaticFallback> fallback = std::make_shared<StaticFallback>();
    std::shared_ptr<RecordingMonitor> monitor = std::make_shared<RecordingMonitor>();

    LocalAgents agents() const {
        LocalAgents a;
        a.chat = chat;
        a.system_commands = system_commands;
        a.rag = rag;
        a.knowledge_retrieval = knowledge;
        a.research = research;
        return a;
    }

    Executor make_executor(LocalAgents local,
                           std::shared_ptr<Router> router = std::make_shared<Router>()) {
        Executor ex(std::move(router), std::move(local), fallback);
        ex.set_monitor(monitor);
        return ex;
    }
};

// ===========================================================================
// Single agent
// ===========================================================================

TEST_F(LegacyExecutorTest, GreetingRunsChatAgent) {
    Executor ex = make_executor(agents());
    ExecutionResponse r = ex.execute_legacy("hello there");

    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.routing_strategy, "single_agent");
    EXPECT_EQ(r.content, "Hello! How can I help?");
    EXPECT_EQ(r.agents_used, (std::vector<AgentType>{AgentType::Chat}));
    ASSERT_TRUE(r.routing_decision.has_value());
    EXPECT_DOUBLE_EQ(r.routing_decision->confidence, 0.9);
    ASSERT_EQ(chat->requests.size(), 1u);
    EXPECT_EQ(chat->requests[0].payload["request"], "hello there");
    EXPECT_TRUE(system_commands->requests.empty());
}

TEST_F(LegacyExecutorTest, ChatHistoryAndContextReachTheAgent) {
    Executor ex = make_executor(agents());
    ex.execute_legacy("hello", json{{"session", "s1"}},
                      {{"user", "earlier question"}, {"assistant", "earlier answer"}});

    ASSERT_EQ(chat->requests.size(), 1u);
    const json& payload = chat->requests[0].payload;
    EXPECT_EQ(payload["context"]["session"], "s1");
    ASSERT_EQ(payload["chat_history"].size(), 2u);
    EXPECT_EQ(payload["chat_history"][1]["content"], "earlier answer");
}

TEST_F(LegacyExecutorTest, SystemCommandRunsSystemAgent) {
    Executor ex = make_executor(agents());
    ExecutionResponse r = ex.execute_legacy("please run ls -la and show disk usage");
    EXPECT_EQ(r.routing_strategy, "single_agent");
    EXPECT_EQ(r.content, "df -h");
    ASSERT_TRUE(r.agent_id.has_value());
    EXPECT_EQ(*r.agent_id, "sys");
}

TEST_F(LegacyExecutorTest, MissingLocalAgentIsSingleAgentError) {
    LocalAgents local = agents();
    local.system_commands = nullptr;
    Executor ex = make_executor(local);

    ExecutionResponse r;
    EXPECT_NO_THROW(r = ex.execute_legacy("run df"));
    EXPECT_EQ(r.status, ResponseStatus::Error);
    EXPECT_EQ(r.routing_strategy, "single_agent_error");
    EXPECT_FALSE(r.error.empty());
}

TEST_F(LegacyExecutorTest, ThrowingPrimaryIsSingleAgentError) {
    LocalAgents local = agents();
    local.chat = std::make_shared<ThrowingAgent>("chat", AgentType::Chat);
    Executor ex = make_executor(local);

    ExecutionResponse r = ex.execute_legacy("hello");
    EXPECT_EQ(r.status, ResponseStatus::Error);
    EXPECT_EQ(r.routing_strategy, "single_agent_error");
    EXPECT_NE(r.error.find("model unavailable"), std::string::npos);
    EXPECT_EQ(monitor->count(EventType::AgentFailed), 1);
}

TEST_F(LegacyExecutorTest, LlmDecisionForPoolOnlyTypeIsSingleAgentError) {
    auto router = router_with_llm(
        R"({"strategy": "single_agent", "primary_agent": "code_search", "confidence": 0.7})");
    Executor ex = make_executor(agents(), router);

    ExecutionResponse r = ex.execute_legacy("tell a joke");
    EXPECT_EQ(r.routing_strategy, "single_agent_error");
}

// ===========================================================================
// Multi agent
// ===========================================================================

TEST_F(LegacyExecutorTest, ResearchIsSynthesizedWithRag) {
    Executor ex = make_executor(agents());
    ExecutionResponse r = ex.execute_legacy("research the latest developments in fusion power");

    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.routing_strategy, "multi_agent");
    EXPECT_TRUE(r.synthesized);
    EXPECT_EQ(r.agents_used, (std::vector<AgentType>{AgentType::Research, AgentType::RAG}));
    EXPECT_EQ(r.secondary_results, (std::vector<std::string>{"Synthesized summary."}));
    EXPECT_EQ(r.content.rfind("Fusion news.", 0), 0u);
    EXPECT_NE(r.content.find("## Additional Information"), std::string::npos);
    EXPECT_NE(r.content.find("Synthesized summary."), std::string::npos);

    // The secondary is asked to synthesize, with the primary answer attached
    ASSERT_EQ(rag->requests.size(), 1u);
    std::string adapted = rag->requests[0].payload["request"].get<std::string>();
    EXPECT_NE(adapted.find("Fusion news."), std::string::npos);
}

TEST_F(LegacyExecutorTest, ThrowingSecondaryIsDropped) {
    LocalAgents local = agents();
    local.rag = std::make_shared<ThrowingAgent>("rag", AgentType::RAG);
    Executor ex = make_executor(local);

    ExecutionResponse r;
    EXPECT_NO_THROW(r = ex.execute_legacy("according to the docs, what is the refund window?"));
    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.routing_strategy, "multi_agent");
    EXPECT_EQ(r.content, "Policy: 30 days.");
    EXPECT_FALSE(r.synthesized);
    EXPECT_TRUE(r.secondary_results.empty());
    EXPECT_EQ(r.content.find("## Additional Information"), std::string::npos);
    EXPECT_EQ(monitor->count(EventType::SecondaryDropped), 1);
}

TEST_F(LegacyExecutorTest, NonStandardThrowFromSecondaryIsDropped) {
    LocalAgents local = agents();
    local.rag = std::make_shared<FunctionAgent>("rag", AgentType::RAG,
                                                [](const AgentRequest&) -> json { throw 42; });
    Executor ex = make_executor(local);

    ExecutionResponse r;
    EXPECT_NO_THROW(r = ex.execute_legacy("please research quantum computing"));
    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.content, "Fusion news.");
    EXPECT_TRUE(r.secondary_results.empty());
    EXPECT_EQ(monitor->count(EventType::SecondaryDropped), 1);
}

TEST_F(LegacyExecutorTest, InvalidUtf8SecondaryResultDoesNotThrow) {
    LocalAgents local = agents();
    local.rag = binary_agent("rag", AgentType::RAG);
    Executor ex = make_executor(local);

    ExecutionResponse r;
    EXPECT_NO_THROW(r = ex.execute_legacy("please research quantum computing"));
    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.routing_strategy, "multi_agent");
    EXPECT_EQ(r.content.rfind("Fusion news.", 0), 0u);
}

TEST_F(LegacyExecutorTest, InvalidUtf8PrimaryResultDoesNotThrow) {
    LocalAgents local = agents();
    local.chat = binary_agent("chat", AgentType::Chat);
    Executor ex = make_executor(local);

    ExecutionResponse r;
    EXPECT_NO_THROW(r = ex.execute_legacy("hello"));
    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.routing_strategy, "single_agent");
    EXPECT_NE(r.content.find("blob"), std::string::npos);
}

TEST_F(LegacyExecutorTest, BlankSecondariesLeaveResponseUnsynthesized) {
    LocalAgents local = agents();
    local.rag = std::make_shared<RecordingAgent>("rag", AgentType::RAG, "   ");
    Executor ex = make_executor(local);

    ExecutionResponse r = ex.execute_legacy("research fusion power");
    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.content, "Fusion news.");
    EXPECT_FALSE(r.synthesized);
    EXPECT_EQ(r.content.find("## Additional Information"), std::string::npos);
}

TEST_F(LegacyExecutorTest, SecondariesRunInDeclaredOrder) {
    auto router = router_with_llm(
        R"({"strategy": "multi_agent", "primary_agent": "chat",
            "secondary_agents": ["knowledge_retrieval", "research", "rag"],
            "confidence": 0.7})");
    LocalAgents local = agents();
    local.research = std::make_shared<ErrorAgent>("web", AgentType::Research);
    Executor ex = make_executor(local, router);

    ExecutionResponse r = ex.execute_legacy("tell a joke");
    EXPECT_EQ(r.routing_strategy, "multi_agent");
    EXPECT_EQ(r.secondary_results,
              (std::vector<std::string>{"Policy: 30 days.", "Synthesized summary."}));
    EXPECT_LT(r.content.find("Policy: 30 days."), r.content.find("Synthesized summary."));
    EXPECT_EQ(monitor->count(EventType::SecondaryDropped), 1);
}

TEST_F(LegacyExecutorTest, FailingPrimaryAbortsMultiAgent) {
    LocalAgents local = agents();
    local.research = std::make_shared<ErrorAgent>("web", AgentType::Research);
    Executor ex = make_executor(local);

    ExecutionResponse r = ex.execute_legacy("research fusion power");
    EXPECT_EQ(r.status, ResponseStatus::Error);
    EXPECT_EQ(r.routing_strategy, "multi_agent_error");
    EXPECT_NE(r.error.find("quota exceeded"), std::string::npos);
    EXPECT_TRUE(rag->requests.empty());
}

TEST_F(LegacyExecutorTest, SynthesizeSkipsEmptySecondaries) {
    Executor ex = make_executor(agents());
    auto combined = ex.synthesize("primary", {"", "  "});
    ASSERT_TRUE(combined.ok());
    EXPECT_EQ(combined.value(), "primary");

    combined = ex.synthesize("primary", {"one", "two"});
    ASSERT_TRUE(combined.ok());
    EXPECT_EQ(combined.value(),
              "primary\n\n## Additional Information\n\none\n\ntwo\n");
}

// ===========================================================================
// Fallback
// ===========================================================================

TEST_F(LegacyExecutorTest, ComplexRequestGoesToFallback) {
    Executor ex = make_executor(agents());
    ExecutionResponse r = ex.execute_legacy(LONG_UNMATCHED);

    EXPECT_EQ(r.status, ResponseStatus::Success);
    EXPECT_EQ(r.routing_strategy, "orchestrator_fallback");
    EXPECT_EQ(r.content, std::string("planned: ") + LONG_UNMATCHED);
    EXPECT_EQ(fallback->calls, 1);
    EXPECT_EQ(monitor->count(EventType::FallbackInvoked), 1);
}

TEST_F(LegacyExecutorTest, OrchestratorPrimaryGoesToFallback) {
    auto router = router_with_llm(
        R"({"strategy": "single_agent", "primary_agent": "orchestrator", "confidence": 0.7})");
    Executor ex = make_executor(agents(), router);

    ExecutionResponse r = ex.execute_legacy("tell a joke");
    EXPECT_EQ(r.routing_strategy, "orchestrator_fallback");
    EXPECT_TRUE(chat->requests.empty());
}

TEST_F(LegacyExecutorTest, ThrowingFallbackYieldsApology) {
    fallback->fail = true;
    Executor ex = make_executor(agents());

    ExecutionResponse r;
    EXPECT_NO_THROW(r = ex.execute_legacy(LONG_UNMATCHED));
    EXPECT_EQ(r.routing_strategy, "final_fallback");
    EXPECT_EQ(r.content, ExecutorConfig{}.final_fallback_message);
    EXPECT_EQ(monitor->count(EventType::FinalFallback), 1);
}

TEST_F(LegacyExecutorTest, NonStandardThrowFromFallbackYieldsApology) {
    fallback->fail_unknown = true;
    Executor ex = make_executor(agents());

    ExecutionResponse r;
    EXPECT_NO_THROW(r = ex.execute_legacy(LONG_UNMATCHED));
    EXPECT_EQ(r.status, ResponseStatus::Error);
    EXPECT_EQ(r.routing_strategy, "final_fallback");
    EXPECT_EQ(r.content, ExecutorConfig{}.final_fallback_message);
    EXPECT_EQ(monitor->count(EventType::FinalFallback), 1);
}

TEST_F(LegacyExecutorTest, MissingFallbackYieldsApology) {
    Executor ex(std::make_shared<Router>(), agents(), nullptr);
    ExecutionResponse r = ex.execute_legacy(LONG_UNMATCHED);
    EXPECT_EQ(r.routing_strategy, "final_fallback");
}

TEST(AgentFallbackHandlerTest, ForwardsToOrchestratorAgent) {
    auto orchestrator = std::make_shared<RecordingAgent>(
        "orch", AgentType::Orchestrator, "Step 1, step 2.");
    AgentFallbackHandler handler(orchestrator);

    ExecutionResponse r = handler.handle("plan my week", json::object(), {});
    EXPECT_EQ(r.content, "Step 1, step 2.");
    EXPECT_EQ(r.agents_used, (std::vector<AgentType>{AgentType::Orchestrator}));
    ASSERT_EQ(orchestrator->requests.size(), 1u);
    EXPECT_EQ(orchestrator->requests[0].payload["request"], "plan my week");
}

TEST(AgentFallbackHandlerTest, AgentErrorThrows) {
    AgentFallbackHandler handler(std::make_shared<ErrorAgent>("orch", AgentType::Orchestrator));
    EXPECT_THROW(handler.handle("plan", json::object(), {}), AgentDispatchException);
}

// ===========================================================================
// Helpers
// ===========================================================================

TEST(LocalAgentsTest, HandlerForUsesSlots) {
    LocalAgents local;
    local.rag = std::make_shared<ErrorAgent>("rag", AgentType::RAG);
    EXPECT_TRUE(local.handler_for(AgentType::RAG) == local.rag);
    EXPECT_FALSE(local.handler_for(AgentType::Chat));
    EXPECT_FALSE(local.handler_for(AgentType::Orchestrator));
    EXPECT_FALSE(local.handler_for(AgentType::CodeSearch));
}

TEST(ExtractAgentTextTest, KnownShapes) {
    EXPECT_EQ(extract_agent_text(json("plain")), "plain");
    EXPECT_EQ(extract_agent_text(json{{"response", "r"}}), "r");
    EXPECT_EQ(extract_agent_text(json{{"answer", "a"}}), "a");
    EXPECT_EQ(extract_agent_text(json()), "");
    EXPECT_EQ(extract_agent_text(json{{"n", 1}}), "{\"n\":1}");
}

TEST(ExtractAgentTextTest, InvalidUtf8IsReplaced) {
    std::string text;
    EXPECT_NO_THROW(text = extract_agent_text(json{{"blob", std::string("a\xff")}}));
    EXPECT_NE(text.find("blob"), std::string::npos);
    EXPECT_NE(text.find("\xef\xbf\xbd"), std::string::npos);
}
