#include "bind_forward.hpp"
#include <agentdispatch/agentdispatch.hpp>
#include <pybind11/stl.h>

using namespace agentdispatch;

// Trampoline class to allow Python subclassing of LlmClient.
// The override returns any JSON-compatible object (str, dict, ...).
class PyLlmClient : public LlmClient {
public:
    using LlmClient::LlmClient;

    json chat_completion(const std::vector<ChatMessage>& messages,
                         const std::string& llm_type,
                         double temperature,
                         int max_tokens,
                         double top_p) override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(this, "chat_completion");
        if (!override) {
            throw LlmClientException("LlmClient.chat_completion is not implemented");
        }
        return json_from_py(override(messages, llm_type, temperature, max_tokens, top_p));
    }
};

// Trampoline class to allow Python subclassing of FallbackHandler
class PyFallbackHandler : public FallbackHandler {
public:
    using FallbackHandler::FallbackHandler;

    ExecutionResponse handle(const std::string& request,
                             const json& context,
                             const std::vector<ChatMessage>& chat_history) override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(this, "handle");
        if (!override) {
            throw AgentDispatchException("FallbackHandler.handle is not implemented");
        }
        return override(request, json_to_py(context), chat_history).cast<ExecutionResponse>();
    }
};

// ---------------------------------------------------------------------------
// bind_routing  --  LlmClient, Router, FallbackHandler, LocalAgents, Executor
// ---------------------------------------------------------------------------
void bind_routing(py::module_& m) {

    // ===================================================================
    // LlmClient
    // ===================================================================
    py::class_<LlmClient, PyLlmClient, std::shared_ptr<LlmClient>>(m, "LlmClient")
        .def(py::init<>());

    m.def("extract_response_content",
          [](py::object response) { return extract_response_content(json_from_py(response)); },
          py::arg("response"));

    // ===================================================================
    // Router
    // ===================================================================
    py::class_<Router, std::shared_ptr<Router>>(m, "Router")
        .def(py::init<CapabilityRegistry, std::shared_ptr<LlmClient>, RouterConfig>(),
             py::arg("capabilities") = CapabilityRegistry{},
             py::arg("llm_client") = py::none(),
             py::arg("config") = RouterConfig{})
        .def("classify",
             [](const Router& self, const std::string& request, py::object context) {
                 json ctx = context.is_none() ? json::object() : json_from_py(context);
                 py::gil_scoped_release release;
                 return self.classify(request, ctx);
             },
             py::arg("request"), py::arg("context") = py::none())
        .def("quick_route_analysis", &Router::quick_route_analysis, py::arg("request"))
        .def("parse_classification",
             [](const Router& self, const std::string& text) {
                 auto parsed = self.parse_classification(text);
                 if (!parsed.ok()) {
                     throw py::value_error(parsed.message());
                 }
                 return parsed.value();
             },
             py::arg("text"))
        .def("build_classification_prompt",
             [](const Router& self, const std::string& request, py::object context) {
                 json ctx = context.is_none() ? json::object() : json_from_py(context);
                 return self.build_classification_prompt(request, ctx);
             },
             py::arg("request"), py::arg("context") = py::none())
        .def_static("adapt_request_for_secondary", &Router::adapt_request_for_secondary,
             py::arg("original"), py::arg("primary_result"), py::arg("secondary_type"))
        .def("set_monitor", &Router::set_monitor, py::arg("monitor"));

    // ===================================================================
    // Fallback handlers
    // ===================================================================
    py::class_<FallbackHandler, PyFallbackHandler, std::shared_ptr<FallbackHandler>>(
            m, "FallbackHandler")
        .def(py::init<>());

    py::class_<AgentFallbackHandler, FallbackHandler, std::shared_ptr<AgentFallbackHandler>>(
            m, "AgentFallbackHandler")
        .def(py::init<std::shared_ptr<Agent>>(), py::arg("orchestrator"));

    // ===================================================================
    // LocalAgents
    // ===================================================================
    py::class_<LocalAgents>(m, "LocalAgents")
        .def(py::init<>())
        .def_readwrite("chat",                &LocalAgents::chat)
        .def_readwrite("system_commands",     &LocalAgents::system_commands)
        .def_readwrite("rag",                 &LocalAgents::rag)
        .def_readwrite("knowledge_retrieval", &LocalAgents::knowledge_retrieval)
        .def_readwrite("research",            &LocalAgents::research)
        .def("handler_for", &LocalAgents::handler_for, py::arg("type"));

    m.def("extract_agent_text",
          [](py::object result) { return extract_agent_text(json_from_py(result)); },
          py::arg("result"));

    // ===================================================================
    // Executor  --  agent calls run with the GIL released
    // ===================================================================
    py::class_<Executor, std::shared_ptr<Executor>>(m, "Executor")
        .def(py::init([](std::shared_ptr<Router> router, LocalAgents local_agents,
                         std::shared_ptr<FallbackHandler> fallback,
                         std::shared_ptr<AgentPoolManager> pool, ExecutorConfig config) {
                 return std::make_shared<Executor>(std::move(router), std::move(local_agents),
                                                   std::move(fallback), std::move(pool),
                                                   std::move(config));
             }),
             py::arg("router"), py::arg("local_agents") = LocalAgents{},
             py::arg("fallback") = py::none(), py::arg("pool") = py::none(),
             py::arg("config") = ExecutorConfig{})
        .def("execute_legacy",
             [](Executor& self, const std::string& request, py::object context,
                const std::vector<ChatMessage>& chat_history) {
                 json ctx = context.is_none() ? json::object() : json_from_py(context);
                 py::gil_scoped_release release;
                 return self.execute_legacy(request, ctx, chat_history);
             },
             py::arg("request"), py::arg("context") = py::none(),
             py::arg("chat_history") = std::vector<ChatMessage>{})
        .def("execute_distributed",
             [](Executor& self, const std::string& request, py::object context,
                const std::vector<std::string>& preferred_agents) {
                 json ctx = context.is_none() ? json::object() : json_from_py(context);
                 py::gil_scoped_release release;
                 return self.execute_distributed(request, ctx, preferred_agents);
             },
             py::arg("request"), py::arg("context") = py::none(),
             py::arg("preferred_agents") = std::vector<std::string>{})
        .def("select_agent",
             [](const Executor& self, const std::string& request,
                const std::vector<std::string>& preferred_agents) -> std::shared_ptr<Agent> {
                 auto selected = self.select_agent(request, preferred_agents);
                 return selected.ok() ? selected.value() : nullptr;
             },
             py::arg("request"), py::arg("preferred_agents") = std::vector<std::string>{})
        .def("synthesize",
             [](const Executor& self, const std::string& primary,
                const std::vector<std::string>& secondaries) {
                 auto combined = self.synthesize(primary, secondaries);
                 return combined.ok() ? combined.value() : primary;
             },
             py::arg("primary"), py::arg("secondaries"))
        .def("set_monitor", &Executor::set_monitor, py::arg("monitor"));
}
