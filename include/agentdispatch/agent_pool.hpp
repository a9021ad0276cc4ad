#pragma once

#include "agentdispatch/types.hpp"
#include "agentdispatch/agent.hpp"
#include "agentdispatch/config.hpp"
#include "agentdispatch/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace agentdispatch {

// Pool bookkeeping for one registered agent
struct PoolAgentInfo {
    std::shared_ptr<Agent> agent;   // shared, lifecycle managed by the caller
    HealthState health{HealthState::Healthy};
    Timestamp last_health_check{};
    std::unordered_set<TaskId> active_tasks;
};

// Registry of pooled agents with health state and in-flight task sets.
//
// Enumeration order is always ascending agent id, so selection policies that
// take "the first" agent or break ties by order are deterministic.
class AgentPoolManager {
public:
    explicit AgentPoolManager(PoolConfig config = PoolConfig{});
    ~AgentPoolManager();

    AgentPoolManager(const AgentPoolManager&) = delete;
    AgentPoolManager& operator=(const AgentPoolManager&) = delete;

    // ==================== Registration ====================

    void register_agent(std::shared_ptr<Agent> agent,
                        HealthState initial_health = HealthState::Healthy);
    bool deregister_agent(const AgentId& id);
    std::size_t agent_count() const;

    // ==================== Queries ====================

    std::vector<std::shared_ptr<Agent>> get_healthy_agents() const;
    std::vector<std::shared_ptr<Agent>> get_all_agents() const;
    std::optional<PoolAgentInfo> get_agent_info(const AgentId& id) const;

    // 0 for unknown agents
    std::size_t active_task_count(const AgentId& id) const;

    PoolSnapshot get_snapshot() const;

    // ==================== Task Bookkeeping ====================

    // Throws AgentNotFoundException if the agent is not registered
    void add_active_task(const AgentId& agent_id, const TaskId& task_id);

    // No-op when the agent or the task is absent
    void remove_active_task(const AgentId& agent_id, const TaskId& task_id);

    // ==================== Health ====================

    bool set_health(const AgentId& id, HealthState health);

    // Probe every agent's health_check() and record the result
    void check_health();

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Background health monitor
    void start();
    void stop();
    bool is_running() const noexcept;

private:
    PoolConfig config_;

    mutable std::shared_mutex state_mutex_;
    std::map<AgentId, PoolAgentInfo> agents_;

    std::shared_ptr<Monitor> monitor_;

    std::thread health_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    void health_loop();
    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<AgentType> agent_type = std::nullopt,
                    std::optional<TaskId> task_id = std::nullopt);
};

// Scoped acquisition of an active-task slot: registers the task on
// construction and removes it on destruction, whatever the exit path.
class ActiveTaskGuard {
public:
    ActiveTaskGuard(AgentPoolManager& pool, AgentId agent_id, TaskId task_id);
    ~ActiveTaskGuard();

    ActiveTaskGuard(const ActiveTaskGuard&) = delete;
    ActiveTaskGuard& operator=(const ActiveTaskGuard&) = delete;

    const TaskEntry& entry() const noexcept;
    Duration elapsed() const;

private:
    AgentPoolManager& pool_;
    TaskEntry entry_;
};

// "task_" followed by 8 random lowercase hex digits
TaskId generate_task_id();

} // namespace agentdispatch
