#pragma once

#include "agentdispatch/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentdispatch {

enum class EventType {
    // Routing
    RequestClassified,
    FastPathRouted,
    LlmClassificationFailed,
    // Legacy execution
    AgentInvoked,
    AgentFailed,
    SecondaryDropped,
    SynthesisFailed,
    FallbackInvoked,
    FinalFallback,
    // Distributed execution
    AgentSelected,
    NoSuitableAgent,
    TaskStarted,
    TaskCompleted,
    // Pool lifecycle
    AgentRegistered,
    AgentDeregistered,
    AgentHealthChanged
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<AgentId> agent_id;
    std::optional<AgentType> agent_type;
    std::optional<TaskId> task_id;
    std::optional<RoutingStrategy> strategy;
    std::optional<double> confidence;

    // Operation duration in milliseconds (agent call, classification)
    std::optional<double> duration_ms;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const PoolSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const PoolSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t classified_requests{0};
        std::uint64_t fast_path_routes{0};
        std::uint64_t llm_classification_failures{0};
        std::uint64_t agent_invocations{0};
        std::uint64_t agent_failures{0};
        std::uint64_t dropped_secondaries{0};
        std::uint64_t synthesis_failures{0};
        std::uint64_t fallbacks{0};
        std::uint64_t final_fallbacks{0};
        std::uint64_t distributed_dispatches{0};
        std::uint64_t no_suitable_agent{0};
        double average_dispatch_time_ms{0.0};
        std::size_t healthy_agents{0};
        std::size_t active_tasks{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const PoolSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::uint64_t dispatch_time_sample_count_{0};
    double dispatch_time_sum_ms_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const PoolSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace agentdispatch
