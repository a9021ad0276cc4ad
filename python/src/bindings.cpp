#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include <agentdispatch/agentdispatch.hpp>

using namespace agentdispatch;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_agentdispatch, m) {
    m.doc() = "AgentDispatch: request routing core for multi-agent systems";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_monitors(m);
    bind_core(m);
    bind_routing(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<AgentType>(m, "AgentType")
        .value("Chat",               AgentType::Chat)
        .value("SystemCommands",     AgentType::SystemCommands)
        .value("RAG",                AgentType::RAG)
        .value("KnowledgeRetrieval", AgentType::KnowledgeRetrieval)
        .value("Research",           AgentType::Research)
        .value("Orchestrator",       AgentType::Orchestrator)
        .value("CodeSearch",         AgentType::CodeSearch)
        .value("Classification",     AgentType::Classification)
        .export_values();

    py::enum_<RoutingStrategy>(m, "RoutingStrategy")
        .value("SingleAgent",          RoutingStrategy::SingleAgent)
        .value("MultiAgent",           RoutingStrategy::MultiAgent)
        .value("OrchestratorAnalysis", RoutingStrategy::OrchestratorAnalysis)
        .export_values();

    py::enum_<ResponseStatus>(m, "ResponseStatus")
        .value("Success", ResponseStatus::Success)
        .value("Error",   ResponseStatus::Error)
        .export_values();

    py::enum_<HealthState>(m, "HealthState")
        .value("Healthy",   HealthState::Healthy)
        .value("Unhealthy", HealthState::Unhealthy)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("RequestClassified",       EventType::RequestClassified)
        .value("FastPathRouted",          EventType::FastPathRouted)
        .value("LlmClassificationFailed", EventType::LlmClassificationFailed)
        .value("AgentInvoked",            EventType::AgentInvoked)
        .value("AgentFailed",             EventType::AgentFailed)
        .value("SecondaryDropped",        EventType::SecondaryDropped)
        .value("SynthesisFailed",         EventType::SynthesisFailed)
        .value("FallbackInvoked",         EventType::FallbackInvoked)
        .value("FinalFallback",           EventType::FinalFallback)
        .value("AgentSelected",           EventType::AgentSelected)
        .value("NoSuitableAgent",         EventType::NoSuitableAgent)
        .value("TaskStarted",             EventType::TaskStarted)
        .value("TaskCompleted",           EventType::TaskCompleted)
        .value("AgentRegistered",         EventType::AgentRegistered)
        .value("AgentDeregistered",       EventType::AgentDeregistered)
        .value("AgentHealthChanged",      EventType::AgentHealthChanged)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    m.def("parse_agent_type", &parse_agent_type, py::arg("name"));
    m.def("agent_type_name", [](AgentType t) { return std::string(to_string(t)); });

    // ---- Structs ----------------------------------------------------------

    // RoutingDecision
    py::class_<RoutingDecision>(m, "RoutingDecision")
        .def(py::init<>())
        .def_readwrite("strategy",         &RoutingDecision::strategy)
        .def_readwrite("primary_agent",    &RoutingDecision::primary_agent)
        .def_readwrite("secondary_agents", &RoutingDecision::secondary_agents)
        .def_readwrite("confidence",       &RoutingDecision::confidence)
        .def_readwrite("reasoning",        &RoutingDecision::reasoning)
        .def("__repr__", [](const RoutingDecision& d) {
            return std::string("<RoutingDecision ") + to_string(d.strategy)
                 + " primary=" + to_string(d.primary_agent)
                 + " confidence=" + std::to_string(d.confidence) + ">";
        });

    // AgentRequest (payload exchanged as a Python object)
    py::class_<AgentRequest>(m, "AgentRequest")
        .def(py::init<>())
        .def_readwrite("request_id", &AgentRequest::request_id)
        .def_readwrite("agent_type", &AgentRequest::agent_type)
        .def_readwrite("action",     &AgentRequest::action)
        .def_readwrite("priority",   &AgentRequest::priority)
        .def_property("payload",
            [](const AgentRequest& r) { return json_to_py(r.payload); },
            [](AgentRequest& r, py::object v) { r.payload = json_from_py(v); });

    // AgentResponse
    py::class_<AgentResponse>(m, "AgentResponse")
        .def(py::init<>())
        .def_readwrite("status",     &AgentResponse::status)
        .def_readwrite("error",      &AgentResponse::error)
        .def_readwrite("agent_id",   &AgentResponse::agent_id)
        .def_readwrite("agent_type", &AgentResponse::agent_type)
        .def_property("result",
            [](const AgentResponse& r) { return json_to_py(r.result); },
            [](AgentResponse& r, py::object v) { r.result = json_from_py(v); });

    // ChatMessage
    py::class_<ChatMessage>(m, "ChatMessage")
        .def(py::init<>())
        .def(py::init([](std::string role, std::string content) {
                 return ChatMessage{std::move(role), std::move(content)};
             }),
             py::arg("role"), py::arg("content"))
        .def_readwrite("role",    &ChatMessage::role)
        .def_readwrite("content", &ChatMessage::content);

    // ExecutionResponse
    py::class_<ExecutionResponse>(m, "ExecutionResponse")
        .def(py::init<>())
        .def_readwrite("status",            &ExecutionResponse::status)
        .def_readwrite("content",           &ExecutionResponse::content)
        .def_readwrite("routing_strategy",  &ExecutionResponse::routing_strategy)
        .def_readwrite("routing_decision",  &ExecutionResponse::routing_decision)
        .def_readwrite("agents_used",       &ExecutionResponse::agents_used)
        .def_readwrite("secondary_results", &ExecutionResponse::secondary_results)
        .def_readwrite("error",             &ExecutionResponse::error)
        .def_readwrite("agent_id",          &ExecutionResponse::agent_id)
        .def_readwrite("task_id",           &ExecutionResponse::task_id)
        .def_readwrite("execution_time",    &ExecutionResponse::execution_time)
        .def_readwrite("synthesized",       &ExecutionResponse::synthesized)
        .def_property("result",
            [](const ExecutionResponse& r) { return json_to_py(r.result); },
            [](ExecutionResponse& r, py::object v) { r.result = json_from_py(v); })
        .def("ok", &ExecutionResponse::ok);

    // PoolAgentSnapshot / PoolSnapshot
    py::class_<PoolAgentSnapshot>(m, "PoolAgentSnapshot")
        .def(py::init<>())
        .def_readwrite("agent_id",     &PoolAgentSnapshot::agent_id)
        .def_readwrite("agent_type",   &PoolAgentSnapshot::agent_type)
        .def_readwrite("health",       &PoolAgentSnapshot::health)
        .def_readwrite("active_tasks", &PoolAgentSnapshot::active_tasks);

    py::class_<PoolSnapshot>(m, "PoolSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",          &PoolSnapshot::timestamp)
        .def_readwrite("agents",             &PoolSnapshot::agents)
        .def_readwrite("healthy_agents",     &PoolSnapshot::healthy_agents)
        .def_readwrite("unhealthy_agents",   &PoolSnapshot::unhealthy_agents)
        .def_readwrite("total_active_tasks", &PoolSnapshot::total_active_tasks);

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",        &MonitorEvent::type)
        .def_readwrite("timestamp",   &MonitorEvent::timestamp)
        .def_readwrite("message",     &MonitorEvent::message)
        .def_readwrite("agent_id",    &MonitorEvent::agent_id)
        .def_readwrite("agent_type",  &MonitorEvent::agent_type)
        .def_readwrite("task_id",     &MonitorEvent::task_id)
        .def_readwrite("strategy",    &MonitorEvent::strategy)
        .def_readwrite("confidence",  &MonitorEvent::confidence)
        .def_readwrite("duration_ms", &MonitorEvent::duration_ms);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("classified_requests",         &MetricsMonitor::Metrics::classified_requests)
        .def_readwrite("fast_path_routes",            &MetricsMonitor::Metrics::fast_path_routes)
        .def_readwrite("llm_classification_failures", &MetricsMonitor::Metrics::llm_classification_failures)
        .def_readwrite("agent_invocations",           &MetricsMonitor::Metrics::agent_invocations)
        .def_readwrite("agent_failures",              &MetricsMonitor::Metrics::agent_failures)
        .def_readwrite("dropped_secondaries",         &MetricsMonitor::Metrics::dropped_secondaries)
        .def_readwrite("synthesis_failures",          &MetricsMonitor::Metrics::synthesis_failures)
        .def_readwrite("fallbacks",                   &MetricsMonitor::Metrics::fallbacks)
        .def_readwrite("final_fallbacks",             &MetricsMonitor::Metrics::final_fallbacks)
        .def_readwrite("distributed_dispatches",      &MetricsMonitor::Metrics::distributed_dispatches)
        .def_readwrite("no_suitable_agent",           &MetricsMonitor::Metrics::no_suitable_agent)
        .def_readwrite("average_dispatch_time_ms",    &MetricsMonitor::Metrics::average_dispatch_time_ms)
        .def_readwrite("healthy_agents",              &MetricsMonitor::Metrics::healthy_agents)
        .def_readwrite("active_tasks",                &MetricsMonitor::Metrics::active_tasks);

    // ---- Configuration ----------------------------------------------------

    py::class_<RouterConfig>(m, "RouterConfig")
        .def(py::init<>())
        .def_readwrite("fast_path_threshold",      &RouterConfig::fast_path_threshold)
        .def_readwrite("short_request_max_tokens", &RouterConfig::short_request_max_tokens)
        .def_readwrite("llm_type",                 &RouterConfig::llm_type)
        .def_readwrite("temperature",              &RouterConfig::temperature)
        .def_readwrite("max_tokens",               &RouterConfig::max_tokens)
        .def_readwrite("top_p",                    &RouterConfig::top_p);

    py::class_<ExecutorConfig>(m, "ExecutorConfig")
        .def(py::init<>())
        .def_readwrite("code_search_keywords",    &ExecutorConfig::code_search_keywords)
        .def_readwrite("classification_keywords", &ExecutorConfig::classification_keywords)
        .def_readwrite("additional_info_heading", &ExecutorConfig::additional_info_heading)
        .def_readwrite("final_fallback_message",  &ExecutorConfig::final_fallback_message);

    py::class_<PoolConfig>(m, "PoolConfig")
        .def(py::init<>())
        .def_readwrite("health_check_interval", &PoolConfig::health_check_interval)
        .def_readwrite("emit_snapshots",        &PoolConfig::emit_snapshots);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("router",   &Config::router)
        .def_readwrite("executor", &Config::executor)
        .def_readwrite("pool",     &Config::pool);

    m.def("load_config", &load_config, py::arg("path"));

    // ---- Priority constants -----------------------------------------------

    m.attr("PRIORITY_LOW")      = PRIORITY_LOW;
    m.attr("PRIORITY_NORMAL")   = PRIORITY_NORMAL;
    m.attr("PRIORITY_HIGH")     = PRIORITY_HIGH;
    m.attr("PRIORITY_CRITICAL") = PRIORITY_CRITICAL;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_AgentDispatchError =
        py::register_exception<AgentDispatchException>(m, "AgentDispatchError", PyExc_RuntimeError);

    // Derived from AgentDispatchError
    static auto py_AgentNotFoundError =
        py::register_exception<AgentNotFoundException>(m, "AgentNotFoundError", py_AgentDispatchError.ptr());
    static auto py_AgentAlreadyRegisteredError =
        py::register_exception<AgentAlreadyRegisteredException>(m, "AgentAlreadyRegisteredError", py_AgentDispatchError.ptr());
    static auto py_InvalidAgentError =
        py::register_exception<InvalidAgentException>(m, "InvalidAgentError", py_AgentDispatchError.ptr());
    static auto py_ConfigError =
        py::register_exception<ConfigException>(m, "ConfigError", py_AgentDispatchError.ptr());
    static auto py_LlmClientError =
        py::register_exception<LlmClientException>(m, "LlmClientError", py_AgentDispatchError.ptr());
}
