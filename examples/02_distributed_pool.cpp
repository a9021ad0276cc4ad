// 02_distributed_pool.cpp
//
// Distributed execution against a pool of remote-style agents.
//
// Scenario:
//   - Three agents join the pool: two general workers and a code search
//     specialist.
//   - Code search requests are steered to the specialist by content
//     affinity; everything else goes to the least loaded worker.
//   - Several client threads dispatch concurrently.
//   - One worker fails its health probe and the background monitor
//     takes it out of rotation.

#include <agentdispatch/agentdispatch.hpp>

#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace agentdispatch;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== AgentDispatch: Distributed Pool Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the pool with a short health check interval.
    // ----------------------------------------------------------------
    PoolConfig pool_config;
    pool_config.health_check_interval = 200ms;
    auto pool = std::make_shared<AgentPoolManager>(pool_config);

    auto metrics = std::make_shared<MetricsMonitor>();
    pool->set_monitor(metrics);

    // ----------------------------------------------------------------
    // 2. Register agents. worker_b becomes unhealthy after a while.
    // ----------------------------------------------------------------
    std::atomic<bool> worker_b_up{true};

    auto make_worker = [](const std::string& id, AgentType type,
                          FunctionAgent::HealthProbe probe = nullptr) {
        return std::make_shared<FunctionAgent>(
            id, type,
            [id](const AgentRequest& req) {
                std::this_thread::sleep_for(20ms);
                return json{{"response", id + " handled: " + req.payload.value("request", "")},
                            {"task", req.request_id}};
            },
            std::move(probe));
    };

    pool->register_agent(make_worker("worker_a", AgentType::Chat));
    pool->register_agent(make_worker("worker_b", AgentType::Chat,
                                     [&worker_b_up] { return worker_b_up.load(); }));
    pool->register_agent(make_worker("code_search", AgentType::CodeSearch));

    pool->start();
    std::cout << "Registered " << pool->agent_count() << " agents, health monitor running.\n\n";

    Executor executor(std::make_shared<Router>(), LocalAgents{}, nullptr, pool);
    executor.set_monitor(metrics);

    // ----------------------------------------------------------------
    // 3. Dispatch from several threads at once.
    // ----------------------------------------------------------------
    const std::vector<std::string> requests = {
        "summarize yesterday's standup notes",
        "find the function that parses the config file",
        "draft a reply to the customer",
        "search the codebase for retry handling",
        "translate this paragraph to french",
        "where is the class that owns the socket",
    };

    std::mutex out_mutex;
    std::vector<std::thread> clients;
    for (const auto& request : requests) {
        clients.emplace_back([&executor, &out_mutex, request] {
            auto r = executor.execute_distributed(request);
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << "[" << r.agent_id.value_or("none") << "] "
                      << request << " -> " << to_string(r.status)
                      << " in " << r.execution_time.value_or(0.0) << "s\n";
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    // ----------------------------------------------------------------
    // 4. Take worker_b down and let the health monitor notice.
    // ----------------------------------------------------------------
    std::cout << "\n--- worker_b stops answering health checks ---\n";
    worker_b_up = false;
    std::this_thread::sleep_for(500ms);

    auto snapshot = pool->get_snapshot();
    std::cout << "Healthy agents: " << snapshot.healthy_agents
              << ", unhealthy: " << snapshot.unhealthy_agents << "\n";
    for (const auto& agent : snapshot.agents) {
        std::cout << "  " << agent.agent_id << " [" << to_string(agent.health) << "] "
                  << agent.active_tasks << " active\n";
    }

    auto r = executor.execute_distributed("one more chat request", json::object(), {"worker_b"});
    std::cout << "Preferred worker_b, served by " << r.agent_id.value_or("none") << "\n";

    // ----------------------------------------------------------------
    // 5. Stop the pool and print metrics.
    // ----------------------------------------------------------------
    pool->stop();

    auto m = metrics->get_metrics();
    std::cout << "\n=== Metrics ===\n";
    std::cout << "Distributed dispatches: " << m.distributed_dispatches << "\n";
    std::cout << "Average dispatch time:  " << m.average_dispatch_time_ms << " ms\n";
    std::cout << "No suitable agent:      " << m.no_suitable_agent << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
