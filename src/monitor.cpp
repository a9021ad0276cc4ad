#include "agentdispatch/monitor.hpp"

#include <iomanip>
#include <iostream>

namespace agentdispatch {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::RequestClassified:       return "RequestClassified";
        case EventType::FastPathRouted:          return "FastPathRouted";
        case EventType::LlmClassificationFailed: return "LlmClassificationFailed";
        case EventType::AgentInvoked:            return "AgentInvoked";
        case EventType::AgentFailed:             return "AgentFailed";
        case EventType::SecondaryDropped:        return "SecondaryDropped";
        case EventType::SynthesisFailed:         return "SynthesisFailed";
        case EventType::FallbackInvoked:         return "FallbackInvoked";
        case EventType::FinalFallback:           return "FinalFallback";
        case EventType::AgentSelected:           return "AgentSelected";
        case EventType::NoSuitableAgent:         return "NoSuitableAgent";
        case EventType::TaskStarted:             return "TaskStarted";
        case EventType::TaskCompleted:           return "TaskCompleted";
        case EventType::AgentRegistered:         return "AgentRegistered";
        case EventType::AgentDeregistered:       return "AgentDeregistered";
        case EventType::AgentHealthChanged:      return "AgentHealthChanged";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::RequestClassified:
        case EventType::LlmClassificationFailed:
        case EventType::AgentFailed:
        case EventType::SecondaryDropped:
        case EventType::SynthesisFailed:
        case EventType::FinalFallback:
        case EventType::NoSuitableAgent:
        case EventType::AgentRegistered:
        case EventType::AgentDeregistered:
        case EventType::AgentHealthChanged:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[AgentDispatch] " << to_string(event.type);

    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.agent_type.has_value()) {
        std::cout << " type=" << to_string(event.agent_type.value());
    }
    if (event.task_id.has_value()) {
        std::cout << " task=" << event.task_id.value();
    }
    if (event.strategy.has_value()) {
        std::cout << " strategy=" << to_string(event.strategy.value());
    }
    if (event.confidence.has_value()) {
        std::cout << " confidence=" << std::fixed << std::setprecision(2)
                  << event.confidence.value();
    }
    if (verbosity_ == Verbosity::Debug && event.duration_ms.has_value()) {
        std::cout << " duration_ms=" << std::fixed << std::setprecision(3)
                  << event.duration_ms.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const PoolSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[AgentDispatch] === Pool Snapshot ===\n";
    std::cout << "  Agents: " << snapshot.agents.size()
              << " (healthy " << snapshot.healthy_agents
              << ", unhealthy " << snapshot.unhealthy_agents << ")\n";
    std::cout << "  Active tasks: " << snapshot.total_active_tasks << "\n";

    for (auto& agent : snapshot.agents) {
        std::cout << "    [" << agent.agent_id << "] type=" << to_string(agent.agent_type)
                  << " health=" << to_string(agent.health)
                  << " active=" << agent.active_tasks << "\n";
    }
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::RequestClassified:
            metrics_.classified_requests++;
            break;
        case EventType::FastPathRouted:
            metrics_.fast_path_routes++;
            break;
        case EventType::LlmClassificationFailed:
            metrics_.llm_classification_failures++;
            break;
        case EventType::AgentInvoked:
            metrics_.agent_invocations++;
            break;
        case EventType::AgentFailed:
            metrics_.agent_failures++;
            break;
        case EventType::SecondaryDropped:
            metrics_.dropped_secondaries++;
            break;
        case EventType::SynthesisFailed:
            metrics_.synthesis_failures++;
            break;
        case EventType::FallbackInvoked:
            metrics_.fallbacks++;
            break;
        case EventType::FinalFallback:
            metrics_.final_fallbacks++;
            break;
        case EventType::NoSuitableAgent:
            metrics_.no_suitable_agent++;
            break;
        case EventType::TaskCompleted:
            metrics_.distributed_dispatches++;
            if (event.duration_ms.has_value()) {
                dispatch_time_sample_count_++;
                dispatch_time_sum_ms_ += event.duration_ms.value();
                metrics_.average_dispatch_time_ms =
                    dispatch_time_sum_ms_ / static_cast<double>(dispatch_time_sample_count_);
            }
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_snapshot(const PoolSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.healthy_agents = snapshot.healthy_agents;
    metrics_.active_tasks = snapshot.total_active_tasks;
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    dispatch_time_sample_count_ = 0;
    dispatch_time_sum_ms_ = 0.0;
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const PoolSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace agentdispatch
