#include "bind_forward.hpp"
#include <agentdispatch/agentdispatch.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agentdispatch;

// Trampoline class to allow Python subclassing of Agent
class PyAgent : public Agent {
public:
    using Agent::Agent;

    AgentResponse process_request(const AgentRequest& request) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(AgentResponse, Agent, process_request, request);
    }

    bool health_check() override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE(bool, Agent, health_check);
    }
};

namespace {

AgentResponse response_for(const Agent& agent, ResponseStatus status) {
    AgentResponse r;
    r.status = status;
    r.agent_id = agent.id();
    r.agent_type = agent.type();
    return r;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// bind_core  --  Agent, FunctionAgent, CapabilityRegistry, AgentPoolManager
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Agent
    // ===================================================================
    py::class_<Agent, PyAgent, std::shared_ptr<Agent>>(m, "Agent")
        .def(py::init<AgentId, AgentType>(), py::arg("id"), py::arg("type"))
        .def("id",              &Agent::id)
        .def("type",            &Agent::type)
        .def("process_request", &Agent::process_request, py::arg("request"))
        .def("health_check",    &Agent::health_check)
        // Response helpers for Python subclasses
        .def("make_success", [](const Agent& self, py::object result) {
                 AgentResponse r = response_for(self, ResponseStatus::Success);
                 r.result = json_from_py(result);
                 return r;
             },
             py::arg("result"))
        .def("make_error", [](const Agent& self, std::string message) {
                 AgentResponse r = response_for(self, ResponseStatus::Error);
                 r.error = std::move(message);
                 return r;
             },
             py::arg("message"))
        .def("__repr__", [](const Agent& a) {
            return "<Agent id='" + a.id() + "' type=" + std::string(to_string(a.type())) + ">";
        });

    // ===================================================================
    // FunctionAgent  --  Python callable returning a JSON-compatible object
    // ===================================================================
    py::class_<FunctionAgent, Agent, std::shared_ptr<FunctionAgent>>(m, "FunctionAgent")
        .def(py::init([](AgentId id, AgentType type, py::function handler,
                         std::optional<py::function> probe) {
                 FunctionAgent::Handler cpp_handler =
                     [fn = py::object(handler)](const AgentRequest& request) {
                         py::gil_scoped_acquire acquire;
                         return json_from_py(fn(request));
                     };
                 FunctionAgent::HealthProbe cpp_probe;
                 if (probe) {
                     cpp_probe = [fn = py::object(*probe)]() {
                         py::gil_scoped_acquire acquire;
                         return fn().cast<bool>();
                     };
                 }
                 return std::make_shared<FunctionAgent>(std::move(id), type,
                                                        std::move(cpp_handler),
                                                        std::move(cpp_probe));
             }),
             py::arg("id"), py::arg("type"), py::arg("handler"),
             py::arg("health_probe") = std::nullopt);

    // ===================================================================
    // CapabilityRegistry
    // ===================================================================
    py::class_<AgentCapability>(m, "AgentCapability")
        .def(py::init<>())
        .def_readwrite("agent_type",     &AgentCapability::agent_type)
        .def_readwrite("model_size",     &AgentCapability::model_size)
        .def_readwrite("specialization", &AgentCapability::specialization)
        .def_readwrite("strengths",      &AgentCapability::strengths)
        .def_readwrite("limitations",    &AgentCapability::limitations)
        .def_readwrite("resource_usage", &AgentCapability::resource_usage);

    py::class_<CapabilityRegistry>(m, "CapabilityRegistry")
        .def(py::init<>())
        .def(py::init<std::vector<AgentCapability>>(), py::arg("capabilities"))
        .def("get",                 &CapabilityRegistry::get, py::arg("type"))
        .def("has",                 &CapabilityRegistry::has, py::arg("type"))
        .def("all",                 &CapabilityRegistry::all)
        .def("size",                &CapabilityRegistry::size)
        .def("types_with_strength", &CapabilityRegistry::types_with_strength,
             py::arg("phrase"))
        .def("describe",            &CapabilityRegistry::describe, py::arg("type"))
        .def("describe_all",        &CapabilityRegistry::describe_all);

    // ===================================================================
    // AgentPoolManager
    // ===================================================================
    py::class_<PoolAgentInfo>(m, "PoolAgentInfo")
        .def_readonly("agent",             &PoolAgentInfo::agent)
        .def_readonly("health",            &PoolAgentInfo::health)
        .def_readonly("last_health_check", &PoolAgentInfo::last_health_check)
        .def_property_readonly("active_tasks", [](const PoolAgentInfo& info) {
            return std::vector<TaskId>(info.active_tasks.begin(), info.active_tasks.end());
        });

    py::class_<AgentPoolManager, std::shared_ptr<AgentPoolManager>>(m, "AgentPoolManager")
        .def(py::init<PoolConfig>(), py::arg("config") = PoolConfig{})

        // ------------- Registration -------------
        .def("register_agent",   &AgentPoolManager::register_agent,
             py::arg("agent"), py::arg("initial_health") = HealthState::Healthy)
        .def("deregister_agent", &AgentPoolManager::deregister_agent, py::arg("id"))
        .def("agent_count",      &AgentPoolManager::agent_count)

        // ------------- Queries -------------
        .def("get_healthy_agents", &AgentPoolManager::get_healthy_agents)
        .def("get_all_agents",     &AgentPoolManager::get_all_agents)
        .def("get_agent_info",     &AgentPoolManager::get_agent_info, py::arg("id"))
        .def("active_task_count",  &AgentPoolManager::active_task_count, py::arg("id"))
        .def("get_snapshot",       &AgentPoolManager::get_snapshot)

        // ------------- Task bookkeeping -------------
        .def("add_active_task",    &AgentPoolManager::add_active_task,
             py::arg("agent_id"), py::arg("task_id"))
        .def("remove_active_task", &AgentPoolManager::remove_active_task,
             py::arg("agent_id"), py::arg("task_id"))

        // ------------- Health -------------
        .def("set_health",   &AgentPoolManager::set_health,
             py::arg("id"), py::arg("health"))
        .def("check_health", &AgentPoolManager::check_health,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Lifecycle -------------
        .def("set_monitor", &AgentPoolManager::set_monitor, py::arg("monitor"))
        .def("start",       &AgentPoolManager::start)
        .def("stop",        &AgentPoolManager::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &AgentPoolManager::is_running);

    m.def("generate_task_id", &generate_task_id);
}
