#include "agentdispatch/executor.hpp"
#include "agentdispatch/exceptions.hpp"

#include "text_util.hpp"

#include <sstream>

namespace agentdispatch {

namespace {

double seconds_since(Timestamp start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

json history_to_json(const std::vector<ChatMessage>& chat_history) {
    json out = json::array();
    for (auto& msg : chat_history) {
        out.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return out;
}

bool contains_any(const std::string& lowered, const std::vector<std::string>& keywords) {
    for (auto& keyword : keywords) {
        if (!keyword.empty() && detail::contains(lowered, detail::to_lower(keyword))) {
            return true;
        }
    }
    return false;
}

bool matches_preference(const Agent& agent, const std::vector<std::string>& preferred) {
    for (auto& entry : preferred) {
        if (entry == agent.id()) return true;
        auto type = parse_agent_type(entry);
        if (type && *type == agent.type()) return true;
    }
    return false;
}

ExecutionResponse error_response(const std::string& tag, std::string message,
                                 const RoutingDecision& decision) {
    ExecutionResponse response;
    response.status = ResponseStatus::Error;
    response.routing_strategy = tag;
    response.routing_decision = decision;
    response.error = message;
    response.content = std::move(message);
    return response;
}

} // anonymous namespace

// ========== LocalAgents ==========

std::shared_ptr<Agent> LocalAgents::handler_for(AgentType type) const {
    switch (type) {
        case AgentType::Chat:               return chat;
        case AgentType::SystemCommands:     return system_commands;
        case AgentType::RAG:                return rag;
        case AgentType::KnowledgeRetrieval: return knowledge_retrieval;
        case AgentType::Research:           return research;
        case AgentType::Orchestrator:
        case AgentType::CodeSearch:
        case AgentType::Classification:
            return nullptr;
    }
    return nullptr;
}

// ========== AgentFallbackHandler ==========

AgentFallbackHandler::AgentFallbackHandler(std::shared_ptr<Agent> orchestrator)
    : orchestrator_(std::move(orchestrator))
{
    if (!orchestrator_) {
        throw InvalidAgentException("AgentFallbackHandler requires an agent");
    }
}

ExecutionResponse AgentFallbackHandler::handle(const std::string& request,
                                               const json& context,
                                               const std::vector<ChatMessage>& chat_history) {
    AgentRequest agent_request;
    agent_request.request_id = generate_task_id();
    agent_request.agent_type = orchestrator_->type();
    agent_request.action = "process";
    agent_request.payload = {
        {"request", request},
        {"context", context},
        {"chat_history", history_to_json(chat_history)},
    };

    AgentResponse agent_response = orchestrator_->process_request(agent_request);
    if (agent_response.status != ResponseStatus::Success) {
        throw AgentDispatchException("Orchestrator failed: " +
                                     agent_response.error.value_or("unknown error"));
    }

    ExecutionResponse response;
    response.status = ResponseStatus::Success;
    response.content = extract_agent_text(agent_response.result);
    response.result = std::move(agent_response.result);
    response.agents_used = {orchestrator_->type()};
    response.agent_id = orchestrator_->id();
    return response;
}

// ========== Text extraction ==========

std::string extract_agent_text(const json& result) {
    if (result.is_string()) {
        return result.get<std::string>();
    }
    if (result.is_object()) {
        for (const char* key : {"response", "content", "text", "answer", "result"}) {
            auto it = result.find(key);
            if (it != result.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    if (result.is_null()) return "";
    // Agents may hand back bytes that are not valid UTF-8
    return result.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ========== Executor ==========

Executor::Executor(std::shared_ptr<const Router> router,
                   LocalAgents local_agents,
                   std::shared_ptr<FallbackHandler> fallback,
                   std::shared_ptr<AgentPoolManager> pool,
                   ExecutorConfig config)
    : router_(std::move(router))
    , local_agents_(std::move(local_agents))
    , fallback_(std::move(fallback))
    , pool_(std::move(pool))
    , config_(std::move(config))
{
    if (!router_) {
        throw AgentDispatchException("Executor requires a router");
    }
}

// ==================== Legacy mode ====================

ExecutionResponse Executor::execute_legacy(const std::string& request,
                                           const json& context,
                                           const std::vector<ChatMessage>& chat_history) {
    RoutingDecision decision = router_->classify(request, context);

    if (decision.strategy == RoutingStrategy::OrchestratorAnalysis ||
        decision.primary_agent == AgentType::Orchestrator) {
        return run_fallback(decision, request, context, chat_history);
    }

    if (decision.strategy == RoutingStrategy::MultiAgent) {
        return run_multi_agent(decision, request, context, chat_history);
    }
    return run_single_agent(decision, request, context, chat_history);
}

Result<std::string> Executor::synthesize(const std::string& primary,
                                         const std::vector<std::string>& secondaries) const {
    try {
        std::ostringstream out;
        out << primary;

        bool heading_written = false;
        for (auto& text : secondaries) {
            if (detail::trim(text).empty()) continue;
            if (!heading_written) {
                out << "\n\n" << config_.additional_info_heading << "\n";
                heading_written = true;
            }
            out << "\n" << text << "\n";
        }
        return Result<std::string>::success(out.str());
    } catch (const std::exception& e) {
        return Result<std::string>::failure(ErrorKind::Synthesis, e.what());
    }
}

ExecutionResponse Executor::run_single_agent(const RoutingDecision& decision,
                                             const std::string& request,
                                             const json& context,
                                             const std::vector<ChatMessage>& chat_history) {
    auto invoked = invoke_local(decision.primary_agent, request, context, chat_history);
    if (!invoked.ok()) {
        return error_response(strategy_tag::SINGLE_AGENT_ERROR, invoked.message(), decision);
    }

    AgentResponse& agent_response = invoked.value();

    ExecutionResponse response;
    response.status = ResponseStatus::Success;
    response.routing_strategy = strategy_tag::SINGLE_AGENT;
    response.routing_decision = decision;
    response.content = extract_agent_text(agent_response.result);
    response.result = std::move(agent_response.result);
    response.agents_used = {decision.primary_agent};
    response.agent_id = agent_response.agent_id;
    return response;
}

ExecutionResponse Executor::run_multi_agent(const RoutingDecision& decision,
                                            const std::string& request,
                                            const json& context,
                                            const std::vector<ChatMessage>& chat_history) {
    auto primary = invoke_local(decision.primary_agent, request, context, chat_history);
    if (!primary.ok()) {
        return error_response(strategy_tag::MULTI_AGENT_ERROR, primary.message(), decision);
    }

    const std::string primary_text = extract_agent_text(primary.value().result);

    ExecutionResponse response;
    response.status = ResponseStatus::Success;
    response.routing_strategy = strategy_tag::MULTI_AGENT;
    response.routing_decision = decision;
    response.result = primary.value().result;
    response.agent_id = primary.value().agent_id;
    response.agents_used = {decision.primary_agent};

    // Secondaries run one after another, in declared order
    for (AgentType secondary : decision.secondary_agents) {
        std::string adapted = Router::adapt_request_for_secondary(request, primary_text, secondary);
        auto outcome = invoke_local(secondary, adapted, context, chat_history);
        if (!outcome.ok()) {
            emit_event(EventType::SecondaryDropped, outcome.message(), std::nullopt, secondary);
            continue;
        }
        response.agents_used.push_back(secondary);
        response.secondary_results.push_back(extract_agent_text(outcome.value().result));
    }

    bool has_additional = false;
    for (auto& text : response.secondary_results) {
        if (!detail::trim(text).empty()) {
            has_additional = true;
            break;
        }
    }
    if (!has_additional) {
        response.content = primary_text;
        return response;
    }

    auto combined = synthesize(primary_text, response.secondary_results);
    if (!combined.ok()) {
        emit_event(EventType::SynthesisFailed, combined.message());
        response.content = primary_text;
        return response;
    }

    response.content = std::move(combined.value());
    response.synthesized = true;
    return response;
}

ExecutionResponse Executor::run_fallback(const RoutingDecision& decision,
                                         const std::string& request,
                                         const json& context,
                                         const std::vector<ChatMessage>& chat_history) {
    emit_event(EventType::FallbackInvoked, decision.reasoning, std::nullopt,
               decision.primary_agent);

    std::string failure = "No fallback handler configured";
    if (fallback_) {
        try {
            ExecutionResponse response = fallback_->handle(request, context, chat_history);
            response.routing_strategy = strategy_tag::ORCHESTRATOR_FALLBACK;
            response.routing_decision = decision;
            return response;
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "Fallback handler failed: unknown exception";
        }
    }

    emit_event(EventType::FinalFallback, failure);

    ExecutionResponse response;
    response.status = ResponseStatus::Error;
    response.routing_strategy = strategy_tag::FINAL_FALLBACK;
    response.routing_decision = decision;
    response.content = config_.final_fallback_message;
    response.error = failure;
    return response;
}

Result<AgentResponse> Executor::invoke_local(AgentType type,
                                             const std::string& request,
                                             const json& context,
                                             const std::vector<ChatMessage>& chat_history) {
    using R = Result<AgentResponse>;

    std::shared_ptr<Agent> agent = local_agents_.handler_for(type);
    if (!agent) {
        return R::failure(ErrorKind::Validation,
                          std::string("No local agent for type: ") + to_string(type));
    }

    AgentRequest agent_request;
    agent_request.request_id = generate_task_id();
    agent_request.agent_type = type;
    agent_request.action = "process";
    agent_request.payload = {
        {"request", request},
        {"context", context},
        {"chat_history", history_to_json(chat_history)},
    };

    auto t0 = Clock::now();
    AgentResponse agent_response;
    try {
        agent_response = agent->process_request(agent_request);
    } catch (const std::exception& e) {
        emit_event(EventType::AgentFailed, e.what(), agent->id(), type);
        return R::failure(ErrorKind::Collaborator,
                          std::string(to_string(type)) + " agent failed: " + e.what());
    } catch (...) {
        emit_event(EventType::AgentFailed, "unknown exception", agent->id(), type);
        return R::failure(ErrorKind::Collaborator,
                          std::string(to_string(type)) + " agent failed: unknown exception");
    }
    double dur_ms = seconds_since(t0) * 1000.0;

    if (agent_response.status != ResponseStatus::Success) {
        std::string message = agent_response.error.value_or("unknown error");
        emit_event(EventType::AgentFailed, message, agent->id(), type, std::nullopt, dur_ms);
        return R::failure(ErrorKind::Collaborator,
                          std::string(to_string(type)) + " agent failed: " + message);
    }

    emit_event(EventType::AgentInvoked, "Agent completed", agent->id(), type,
               std::nullopt, dur_ms);
    if (agent_response.agent_id.empty()) {
        agent_response.agent_id = agent->id();
    }
    return R::success(std::move(agent_response));
}

// ==================== Distributed mode ====================

Result<std::shared_ptr<Agent>> Executor::select_agent(
    const std::string& request,
    const std::vector<std::string>& preferred_agents) const {
    using R = Result<std::shared_ptr<Agent>>;

    if (!pool_) {
        return R::failure(ErrorKind::NoSuitableAgent, "No agent pool configured");
    }

    auto healthy = pool_->get_healthy_agents();
    if (healthy.empty()) {
        return R::failure(ErrorKind::NoSuitableAgent, "No suitable agent available");
    }

    // Content affinity
    const std::string lowered = detail::to_lower(request);
    std::optional<AgentType> affinity;
    if (contains_any(lowered, config_.code_search_keywords)) {
        affinity = AgentType::CodeSearch;
    } else if (contains_any(lowered, config_.classification_keywords)) {
        affinity = AgentType::Classification;
    }
    if (affinity) {
        for (auto& agent : healthy) {
            if (agent->type() == *affinity) return R::success(agent);
        }
    }

    // Caller preference
    if (!preferred_agents.empty()) {
        for (auto& agent : healthy) {
            if (matches_preference(*agent, preferred_agents)) return R::success(agent);
        }
    }

    // Least loaded; strict comparison keeps the earliest id on ties
    std::shared_ptr<Agent> best;
    std::size_t best_load = 0;
    for (auto& agent : healthy) {
        std::size_t load = pool_->active_task_count(agent->id());
        if (!best || load < best_load) {
            best = agent;
            best_load = load;
        }
    }
    return R::success(best);
}

ExecutionResponse Executor::execute_distributed(const std::string& request,
                                                const json& context,
                                                const std::vector<std::string>& preferred_agents) {
    auto selected = select_agent(request, preferred_agents);
    if (!selected.ok()) {
        emit_event(EventType::NoSuitableAgent, selected.message());

        ExecutionResponse response;
        response.status = ResponseStatus::Error;
        response.routing_strategy = strategy_tag::DISTRIBUTED_ERROR;
        response.error = "No suitable agent available";
        response.content = response.error;
        return response;
    }

    std::shared_ptr<Agent> agent = selected.value();
    emit_event(EventType::AgentSelected, "Agent selected", agent->id(), agent->type());

    const TaskId task_id = generate_task_id();

    AgentRequest agent_request;
    agent_request.request_id = task_id;
    agent_request.agent_type = agent->type();
    agent_request.action = "process";
    agent_request.payload = {{"request", request}, {"context", context}};

    ExecutionResponse response;
    response.routing_strategy = strategy_tag::DISTRIBUTED;
    response.agent_id = agent->id();
    response.task_id = task_id;
    response.agents_used = {agent->type()};

    std::optional<ActiveTaskGuard> guard;
    try {
        guard.emplace(*pool_, agent->id(), task_id);
    } catch (const AgentNotFoundException& e) {
        // Deregistered between selection and dispatch
        emit_event(EventType::NoSuitableAgent, e.what(), agent->id(), agent->type());
        response.status = ResponseStatus::Error;
        response.routing_strategy = strategy_tag::DISTRIBUTED_ERROR;
        response.error = "No suitable agent available";
        response.content = response.error;
        return response;
    }

    try {
        AgentResponse agent_response = agent->process_request(agent_request);
        response.status = agent_response.status;
        response.content = agent_response.status == ResponseStatus::Success
            ? extract_agent_text(agent_response.result)
            : agent_response.error.value_or("unknown error");
        response.error = agent_response.error.value_or("");
        response.result = std::move(agent_response.result);
    } catch (const std::exception& e) {
        response.status = ResponseStatus::Error;
        response.error = e.what();
        response.content = e.what();
        emit_event(EventType::AgentFailed, e.what(), agent->id(), agent->type(), task_id);
    } catch (...) {
        response.status = ResponseStatus::Error;
        response.error = "Agent failed: unknown exception";
        response.content = response.error;
        emit_event(EventType::AgentFailed, response.error, agent->id(), agent->type(), task_id);
    }

    double elapsed = std::chrono::duration<double>(guard->elapsed()).count();
    response.execution_time = elapsed;
    emit_event(EventType::TaskCompleted, to_string(response.status), agent->id(),
               agent->type(), task_id, elapsed * 1000.0);
    return response;
}

// ==================== Configuration ====================

void Executor::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

const ExecutorConfig& Executor::config() const noexcept {
    return config_;
}

void Executor::emit_event(EventType type, const std::string& message,
                          std::optional<AgentId> agent_id,
                          std::optional<AgentType> agent_type,
                          std::optional<TaskId> task_id,
                          std::optional<double> duration_ms) const {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent_id = std::move(agent_id);
    event.agent_type = agent_type;
    event.task_id = std::move(task_id);
    event.duration_ms = duration_ms;

    monitor_->on_event(event);
}

} // namespace agentdispatch
