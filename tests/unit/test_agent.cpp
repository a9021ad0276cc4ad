#include <gtest/gtest.h>
#include <agentdispatch/agentdispatch.hpp>

using namespace agentdispatch;

namespace {

// Reports errors through the response envelope instead of throwing
class RefusingAgent : public Agent {
public:
    RefusingAgent() : Agent("refuser", AgentType::Research) {}

    AgentResponse process_request(const AgentRequest&) override {
        return make_error("offline");
    }
};

} // anonymous namespace

TEST(AgentTest, FunctionAgentWrapsHandlerResult) {
    FunctionAgent agent("npu_chat", AgentType::Chat, [](const AgentRequest& req) {
        return json{{"response", "echo: " + req.payload.value("request", std::string())}};
    });

    AgentRequest req;
    req.payload = {{"request", "hi"}};
    AgentResponse resp = agent.process_request(req);

    EXPECT_EQ(resp.status, ResponseStatus::Success);
    EXPECT_EQ(resp.agent_id, "npu_chat");
    EXPECT_EQ(resp.agent_type, AgentType::Chat);
    EXPECT_EQ(resp.result["response"], "echo: hi");
    EXPECT_FALSE(resp.error.has_value());
}

TEST(AgentTest, FunctionAgentPropagatesHandlerExceptions) {
    FunctionAgent agent("boom", AgentType::Chat, [](const AgentRequest&) -> json {
        throw std::runtime_error("model crashed");
    });
    EXPECT_THROW(agent.process_request(AgentRequest{}), std::runtime_error);
}

TEST(AgentTest, MakeErrorSetsStatusAndMessage) {
    RefusingAgent agent;
    AgentResponse resp = agent.process_request(AgentRequest{});
    EXPECT_EQ(resp.status, ResponseStatus::Error);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(*resp.error, "offline");
    EXPECT_EQ(resp.agent_id, "refuser");
}

TEST(AgentTest, DefaultHealthCheckIsHealthy) {
    RefusingAgent agent;
    EXPECT_TRUE(agent.health_check());
}

TEST(AgentTest, HealthProbeIsConsulted) {
    bool up = false;
    FunctionAgent agent("probe", AgentType::RAG,
                        [](const AgentRequest&) { return json("ok"); },
                        [&up] { return up; });
    EXPECT_FALSE(agent.health_check());
    up = true;
    EXPECT_TRUE(agent.health_check());
}

TEST(AgentTest, EmptyIdIsRejected) {
    EXPECT_THROW(FunctionAgent("", AgentType::Chat,
                               [](const AgentRequest&) { return json(); }),
                 InvalidAgentException);
}

TEST(AgentTest, NullHandlerIsRejected) {
    EXPECT_THROW(FunctionAgent("x", AgentType::Chat, nullptr), InvalidAgentException);
}
