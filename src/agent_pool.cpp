#include "agentdispatch/agent_pool.hpp"
#include "agentdispatch/exceptions.hpp"

#include <random>

namespace agentdispatch {

AgentPoolManager::AgentPoolManager(PoolConfig config)
    : config_(std::move(config))
{}

AgentPoolManager::~AgentPoolManager() {
    stop();
}

// ==================== Registration ====================

void AgentPoolManager::register_agent(std::shared_ptr<Agent> agent, HealthState initial_health) {
    if (!agent) {
        throw InvalidAgentException("Cannot register a null agent");
    }

    std::unique_lock lock(state_mutex_);
    const AgentId id = agent->id();
    const AgentType type = agent->type();
    if (agents_.count(id) > 0) {
        throw AgentAlreadyRegisteredException(id);
    }

    PoolAgentInfo info;
    info.agent = std::move(agent);
    info.health = initial_health;
    info.last_health_check = Clock::now();
    agents_.emplace(id, std::move(info));
    lock.unlock();

    emit_event(EventType::AgentRegistered, "Agent registered", id, type);
}

bool AgentPoolManager::deregister_agent(const AgentId& id) {
    std::unique_lock lock(state_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return false;

    AgentType type = it->second.agent->type();
    agents_.erase(it);
    lock.unlock();

    emit_event(EventType::AgentDeregistered, "Agent deregistered", id, type);
    return true;
}

std::size_t AgentPoolManager::agent_count() const {
    std::shared_lock lock(state_mutex_);
    return agents_.size();
}

// ==================== Queries ====================

std::vector<std::shared_ptr<Agent>> AgentPoolManager::get_healthy_agents() const {
    std::shared_lock lock(state_mutex_);
    std::vector<std::shared_ptr<Agent>> result;
    for (auto& [_, info] : agents_) {
        if (info.health == HealthState::Healthy) {
            result.push_back(info.agent);
        }
    }
    return result;
}

std::vector<std::shared_ptr<Agent>> AgentPoolManager::get_all_agents() const {
    std::shared_lock lock(state_mutex_);
    std::vector<std::shared_ptr<Agent>> result;
    result.reserve(agents_.size());
    for (auto& [_, info] : agents_) {
        result.push_back(info.agent);
    }
    return result;
}

std::optional<PoolAgentInfo> AgentPoolManager::get_agent_info(const AgentId& id) const {
    std::shared_lock lock(state_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return std::nullopt;
    return it->second;
}

std::size_t AgentPoolManager::active_task_count(const AgentId& id) const {
    std::shared_lock lock(state_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return 0;
    return it->second.active_tasks.size();
}

PoolSnapshot AgentPoolManager::get_snapshot() const {
    std::shared_lock lock(state_mutex_);
    PoolSnapshot snap;
    snap.timestamp = Clock::now();

    for (auto& [id, info] : agents_) {
        PoolAgentSnapshot as;
        as.agent_id = id;
        as.agent_type = info.agent->type();
        as.health = info.health;
        as.active_tasks = info.active_tasks.size();
        snap.agents.push_back(std::move(as));

        if (info.health == HealthState::Healthy) {
            snap.healthy_agents++;
        } else {
            snap.unhealthy_agents++;
        }
        snap.total_active_tasks += info.active_tasks.size();
    }
    return snap;
}

// ==================== Task Bookkeeping ====================

void AgentPoolManager::add_active_task(const AgentId& agent_id, const TaskId& task_id) {
    std::unique_lock lock(state_mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        throw AgentNotFoundException(agent_id);
    }
    it->second.active_tasks.insert(task_id);
    lock.unlock();

    emit_event(EventType::TaskStarted, "Active task added", agent_id, std::nullopt, task_id);
}

void AgentPoolManager::remove_active_task(const AgentId& agent_id, const TaskId& task_id) {
    std::unique_lock lock(state_mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) return;
    it->second.active_tasks.erase(task_id);
}

// ==================== Health ====================

bool AgentPoolManager::set_health(const AgentId& id, HealthState health) {
    std::unique_lock lock(state_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return false;

    bool changed = it->second.health != health;
    it->second.health = health;
    it->second.last_health_check = Clock::now();
    AgentType type = it->second.agent->type();
    lock.unlock();

    if (changed) {
        emit_event(EventType::AgentHealthChanged,
                   std::string("Health changed to ") + to_string(health), id, type);
    }
    return true;
}

void AgentPoolManager::check_health() {
    // Probe outside the lock: health checks may be slow
    auto agents = get_all_agents();

    for (auto& agent : agents) {
        bool healthy = false;
        std::string detail;
        try {
            healthy = agent->health_check();
        } catch (const std::exception& e) {
            healthy = false;
            detail = e.what();
        }

        HealthState state = healthy ? HealthState::Healthy : HealthState::Unhealthy;

        std::unique_lock lock(state_mutex_);
        auto it = agents_.find(agent->id());
        if (it == agents_.end()) continue;  // deregistered while probing

        bool changed = it->second.health != state;
        it->second.health = state;
        it->second.last_health_check = Clock::now();
        lock.unlock();

        if (changed) {
            std::string message = std::string("Health changed to ") + to_string(state);
            if (!detail.empty()) message += ": " + detail;
            emit_event(EventType::AgentHealthChanged, message, agent->id(), agent->type());
        }
    }
}

// ==================== Configuration ====================

void AgentPoolManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

void AgentPoolManager::start() {
    if (running_.exchange(true)) return;  // Already running
    health_thread_ = std::thread(&AgentPoolManager::health_loop, this);
}

void AgentPoolManager::stop() {
    if (!running_.exchange(false)) return;  // Already stopped
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (health_thread_.joinable()) {
        health_thread_.join();
    }
}

bool AgentPoolManager::is_running() const noexcept {
    return running_.load();
}

void AgentPoolManager::health_loop() {
    while (running_.load()) {
        check_health();

        if (config_.emit_snapshots && monitor_) {
            monitor_->on_snapshot(get_snapshot());
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.health_check_interval, [this] {
            return !running_.load();
        });
    }
}

void AgentPoolManager::emit_event(EventType type, const std::string& message,
                                  std::optional<AgentId> agent_id,
                                  std::optional<AgentType> agent_type,
                                  std::optional<TaskId> task_id) {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent_id = std::move(agent_id);
    event.agent_type = agent_type;
    event.task_id = std::move(task_id);

    monitor_->on_event(event);
}

// ========== ActiveTaskGuard ==========

ActiveTaskGuard::ActiveTaskGuard(AgentPoolManager& pool, AgentId agent_id, TaskId task_id)
    : pool_(pool)
{
    entry_.task_id = std::move(task_id);
    entry_.agent_id = std::move(agent_id);
    entry_.start_time = Clock::now();

    try {
        pool_.add_active_task(entry_.agent_id, entry_.task_id);
    } catch (...) {
        // The destructor will not run; release whatever add may have recorded
        pool_.remove_active_task(entry_.agent_id, entry_.task_id);
        throw;
    }
}

ActiveTaskGuard::~ActiveTaskGuard() {
    pool_.remove_active_task(entry_.agent_id, entry_.task_id);
}

const TaskEntry& ActiveTaskGuard::entry() const noexcept {
    return entry_;
}

Duration ActiveTaskGuard::elapsed() const {
    return Clock::now() - entry_.start_time;
}

// ========== Task ids ==========

TaskId generate_task_id() {
    static const char* digits = "0123456789abcdef";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);

    TaskId id = "task_";
    for (int i = 0; i < 8; ++i) {
        id += digits[dist(rng)];
    }
    return id;
}

} // namespace agentdispatch
