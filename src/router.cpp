#include "agentdispatch/router.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace agentdispatch {

namespace {

// Single words match whole request tokens; phrases match as substrings.
struct KeywordSet {
    std::unordered_set<std::string> words;
    std::vector<std::string> phrases;

    bool matches(const std::string& lowered,
                 const std::vector<std::string>& tokens) const {
        for (auto& token : tokens) {
            if (words.count(token) > 0) return true;
        }
        for (auto& phrase : phrases) {
            if (detail::contains(lowered, phrase)) return true;
        }
        return false;
    }
};

const KeywordSet& greeting_keywords() {
    static const KeywordSet set{
        {"hello", "hi", "hey", "greetings", "howdy", "thanks", "bye", "goodbye"},
        {"good morning", "good afternoon", "good evening", "how are you",
         "thank you", "what's up", "nice to meet you"},
    };
    return set;
}

const KeywordSet& system_command_keywords() {
    static const KeywordSet set{
        {"run", "execute", "command", "commands", "shell", "terminal", "bash", "sudo",
         "install", "uninstall", "ls", "ps", "df", "du", "mkdir", "chmod", "chown",
         "kill", "grep", "systemctl", "apt", "ping", "ifconfig", "netstat"},
        {"disk usage", "disk space", "memory usage", "cpu usage", "list files",
         "running processes", "network interfaces", "ip address"},
    };
    return set;
}

const KeywordSet& research_keywords() {
    static const KeywordSet set{
        {"research", "investigate"},
        {"search the web", "search web", "web search", "search online", "find online",
         "look up online", "latest news", "current events", "recent developments",
         "on the internet", "browse the web"},
    };
    return set;
}

const KeywordSet& knowledge_keywords() {
    static const KeywordSet set{
        {"documentation", "docs", "knowledge", "explain", "definition", "define"},
        {"according to", "based on documents", "based on the documents",
         "in the documentation", "knowledge base", "what is", "what are",
         "how does", "tell me about"},
    };
    return set;
}

RoutingDecision make_decision(RoutingStrategy strategy, AgentType primary,
                              std::vector<AgentType> secondaries, double confidence,
                              std::string reasoning) {
    RoutingDecision d;
    d.strategy = strategy;
    d.primary_agent = primary;
    d.secondary_agents = std::move(secondaries);
    d.confidence = confidence;
    d.reasoning = std::move(reasoning);
    return d;
}

} // anonymous namespace

Router::Router(CapabilityRegistry capabilities, std::shared_ptr<LlmClient> llm_client,
               RouterConfig config)
    : capabilities_(std::move(capabilities))
    , llm_client_(std::move(llm_client))
    , config_(std::move(config))
{}

RoutingDecision Router::classify(const std::string& request, const json& context) const {
    RoutingDecision quick = quick_route_analysis(request);

    if (quick.confidence > config_.fast_path_threshold) {
        emit_event(EventType::FastPathRouted, quick.reasoning, &quick);
        emit_event(EventType::RequestClassified, "Pattern classification", &quick);
        return quick;
    }

    if (!llm_client_) {
        emit_event(EventType::RequestClassified, "Pattern classification (no LLM)", &quick);
        return quick;
    }

    auto llm_decision = classify_with_llm(request, context);
    if (!llm_decision) {
        emit_event(EventType::RequestClassified, "Falling back to pattern classification",
                   &quick);
        return quick;
    }

    emit_event(EventType::RequestClassified, "LLM classification", &*llm_decision);
    return *llm_decision;
}

RoutingDecision Router::quick_route_analysis(const std::string& request) const {
    const std::string lowered = detail::to_lower(request);
    const std::vector<std::string> tokens = detail::normalized_words(request);

    if (greeting_keywords().matches(lowered, tokens)) {
        return make_decision(RoutingStrategy::SingleAgent, AgentType::Chat, {}, 0.9,
                             "Greeting or conversational pattern detected");
    }
    if (system_command_keywords().matches(lowered, tokens)) {
        return make_decision(RoutingStrategy::SingleAgent, AgentType::SystemCommands, {}, 0.9,
                             "System command pattern detected");
    }
    if (research_keywords().matches(lowered, tokens)) {
        return make_decision(RoutingStrategy::MultiAgent, AgentType::Research,
                             {AgentType::RAG}, 0.85,
                             "Research pattern detected, synthesizing findings with RAG");
    }
    if (knowledge_keywords().matches(lowered, tokens)) {
        return make_decision(RoutingStrategy::MultiAgent, AgentType::KnowledgeRetrieval,
                             {AgentType::RAG}, 0.85,
                             "Knowledge pattern detected, synthesizing documents with RAG");
    }

    if (detail::split_whitespace(request).size() <= config_.short_request_max_tokens) {
        return make_decision(RoutingStrategy::SingleAgent, AgentType::Chat, {}, 0.6,
                             "Short request without specific pattern, defaulting to chat");
    }
    return make_decision(RoutingStrategy::OrchestratorAnalysis, AgentType::Orchestrator, {}, 0.5,
                         "Complex request without specific pattern, needs orchestration");
}

Result<RoutingDecision> Router::parse_classification(const std::string& llm_text) const {
    using R = Result<RoutingDecision>;

    auto first_brace = llm_text.find('{');
    auto last_brace = llm_text.rfind('}');
    if (first_brace == std::string::npos || last_brace == std::string::npos ||
        last_brace < first_brace) {
        return R::failure(ErrorKind::Validation, "No JSON object in classifier output");
    }

    json parsed;
    try {
        parsed = json::parse(llm_text.substr(first_brace, last_brace - first_brace + 1));
    } catch (const json::parse_error& e) {
        return R::failure(ErrorKind::Validation,
                          std::string("Malformed classifier JSON: ") + e.what());
    }

    RoutingDecision decision;
    try {
        auto strategy = parse_routing_strategy(parsed.at("strategy").get<std::string>());
        if (!strategy) {
            return R::failure(ErrorKind::Validation,
                              "Unknown strategy: " + parsed.at("strategy").get<std::string>());
        }
        decision.strategy = *strategy;

        const std::string primary_name = parsed.at("primary_agent").get<std::string>();
        auto primary = parse_agent_type(primary_name);
        if (!primary) {
            return R::failure(ErrorKind::Validation, "Unknown agent type: " + primary_name);
        }
        decision.primary_agent = *primary;

        if (auto it = parsed.find("secondary_agents"); it != parsed.end() && !it->is_null()) {
            for (auto& entry : *it) {
                const std::string name = entry.get<std::string>();
                auto secondary = parse_agent_type(name);
                if (!secondary) {
                    return R::failure(ErrorKind::Validation, "Unknown agent type: " + name);
                }
                decision.secondary_agents.push_back(*secondary);
            }
        }

        decision.confidence = parsed.at("confidence").get<double>();
        decision.reasoning = parsed.value("reasoning", std::string("LLM classification"));
    } catch (const json::exception& e) {
        return R::failure(ErrorKind::Validation,
                          std::string("Invalid classifier fields: ") + e.what());
    }

    if (decision.confidence < 0.0 || decision.confidence > 1.0) {
        return R::failure(ErrorKind::Validation, "Confidence outside [0, 1]");
    }
    if (decision.strategy != RoutingStrategy::MultiAgent) {
        decision.secondary_agents.clear();
    }
    return R::success(std::move(decision));
}

std::string Router::build_classification_prompt(const std::string& request,
                                                const json& context) const {
    std::ostringstream out;
    out << "Classify the user request and choose which agents should handle it.\n\n"
        << "Available agents:\n"
        << capabilities_.describe_all() << "\n"
        << "Strategies:\n"
        << "  single_agent: one agent fully handles the request\n"
        << "  multi_agent: a primary agent answers, secondary agents add to its answer\n"
        << "  orchestrator_analysis: the request needs multi-step planning\n\n"
        << "Respond with exactly one JSON object and nothing else:\n"
        << "{\"strategy\": \"single_agent|multi_agent|orchestrator_analysis\", "
        << "\"primary_agent\": \"<agent>\", \"secondary_agents\": [\"<agent>\"], "
        << "\"confidence\": <0.0-1.0>, \"reasoning\": \"<short explanation>\"}\n\n"
        << "Request: " << request << "\n";

    if (context.is_object() && !context.empty()) {
        // Invalid UTF-8 in caller context is replaced rather than rejected
        out << "Context: " << context.dump(-1, ' ', false, json::error_handler_t::replace)
            << "\n";
    }
    return out.str();
}

std::string Router::adapt_request_for_secondary(const std::string& original,
                                                const std::string& primary_result,
                                                AgentType secondary_type) {
    switch (secondary_type) {
        case AgentType::RAG:
            return "Synthesize a comprehensive answer to the request below using the "
                   "information already gathered.\n\nOriginal request: " + original +
                   "\n\nInformation gathered:\n" + primary_result;
        case AgentType::Research:
            return "Find additional information that complements the current answer.\n\n"
                   "Original request: " + original +
                   "\n\nCurrent answer:\n" + primary_result;
        case AgentType::KnowledgeRetrieval:
            return "Search the knowledge base for documentation supporting the current "
                   "answer.\n\nOriginal request: " + original +
                   "\n\nCurrent answer:\n" + primary_result;
        default:
            return original + "\n\nContext from previous agent:\n" + primary_result;
    }
}

const CapabilityRegistry& Router::capabilities() const noexcept {
    return capabilities_;
}

const RouterConfig& Router::config() const noexcept {
    return config_;
}

void Router::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

std::optional<RoutingDecision> Router::classify_with_llm(const std::string& request,
                                                         const json& context) const {
    auto t0 = Clock::now();
    std::string content;
    try {
        std::vector<ChatMessage> messages = {
            {"system", "You are a request router. You only output JSON."},
            {"user", build_classification_prompt(request, context)},
        };
        json response = llm_client_->chat_completion(messages, config_.llm_type,
                                                     config_.temperature,
                                                     config_.max_tokens, config_.top_p);
        content = extract_response_content(response);
    } catch (const std::exception& e) {
        emit_event(EventType::LlmClassificationFailed,
                   std::string("LLM call failed: ") + e.what());
        return std::nullopt;
    } catch (...) {
        emit_event(EventType::LlmClassificationFailed, "LLM call failed: unknown exception");
        return std::nullopt;
    }
    double dur_ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();

    auto parsed = parse_classification(content);
    if (!parsed.ok()) {
        emit_event(EventType::LlmClassificationFailed, parsed.message(), nullptr, dur_ms);
        return std::nullopt;
    }
    return parsed.value();
}

void Router::emit_event(EventType type, const std::string& message,
                        const RoutingDecision* decision,
                        std::optional<double> duration_ms) const {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    if (decision) {
        event.agent_type = decision->primary_agent;
        event.strategy = decision->strategy;
        event.confidence = decision->confidence;
    }
    event.duration_ms = duration_ms;

    monitor_->on_event(event);
}

} // namespace agentdispatch
