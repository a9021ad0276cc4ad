#include <gtest/gtest.h>
#include <agentdispatch/agentdispatch.hpp>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

using namespace agentdispatch;
using namespace std::chrono_literals;

// ===========================================================================
// Concurrent stress test: 8 threads dispatching onto 4 pooled agents
// ===========================================================================

TEST(ConcurrentDispatchTest, StressTest_8Threads_4Agents) {
    constexpr int NUM_THREADS = 8;
    constexpr int NUM_AGENTS = 4;
    constexpr int OPS_PER_THREAD = 50;

    auto pool = std::make_shared<AgentPoolManager>();
    auto metrics = std::make_shared<MetricsMonitor>();
    Executor executor(std::make_shared<Router>(), LocalAgents{}, nullptr, pool);
    executor.set_monitor(metrics);

    std::atomic<int> max_in_flight{0};
    std::atomic<int> in_flight{0};

    // Every other agent fails a third of its calls
    for (int i = 0; i < NUM_AGENTS; ++i) {
        bool flaky = (i % 2 == 1);
        auto counter = std::make_shared<std::atomic<int>>(0);
        pool->register_agent(std::make_shared<FunctionAgent>(
            "npu_worker_" + std::to_string(i), AgentType::Chat,
            [&, flaky, counter](const AgentRequest&) -> json {
                int now = ++in_flight;
                int prev = max_in_flight.load();
                while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {}

                std::this_thread::sleep_for(100us);
                int n = ++(*counter);
                --in_flight;
                if (flaky && n % 3 == 0) {
                    throw std::runtime_error("transient device error");
                }
                return json{{"response", "ok"}};
            }));
    }

    std::atomic<int> successes{0};
    std::atomic<int> failures{0};
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<unsigned>(t * 31 + 5));
            std::uniform_int_distribution<int> pick(0, NUM_AGENTS);

            for (int op = 0; op < OPS_PER_THREAD; ++op) {
                try {
                    std::vector<std::string> preferred;
                    int choice = pick(rng);
                    if (choice < NUM_AGENTS) {
                        preferred.push_back("npu_worker_" + std::to_string(choice));
                    }

                    auto r = executor.execute_distributed("process item " + std::to_string(op),
                                                          json::object(), preferred);
                    if (r.ok()) {
                        ++successes;
                    } else {
                        ++failures;
                    }
                } catch (const std::exception&) {
                    ++errors;
                }
            }
        });
    }

    for (auto& th : threads) th.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(successes.load() + failures.load(), NUM_THREADS * OPS_PER_THREAD);
    EXPECT_GT(successes.load(), 0);
    EXPECT_GE(max_in_flight.load(), 1);

    // Every task slot was released
    PoolSnapshot snap = pool->get_snapshot();
    EXPECT_EQ(snap.total_active_tasks, 0u);

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.distributed_dispatches,
              static_cast<std::uint64_t>(NUM_THREADS * OPS_PER_THREAD));
}

// ===========================================================================
// Load balancing: slow agents accumulate tasks, new work goes elsewhere
// ===========================================================================

TEST(ConcurrentDispatchTest, BusyAgentIsAvoided) {
    auto pool = std::make_shared<AgentPoolManager>();
    Executor executor(std::make_shared<Router>(), LocalAgents{}, nullptr, pool);

    std::atomic<bool> release{false};
    std::atomic<bool> started{false};

    pool->register_agent(std::make_shared<FunctionAgent>(
        "a_slow", AgentType::Chat, [&](const AgentRequest&) {
            started = true;
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
            return json("slow done");
        }));
    pool->register_agent(std::make_shared<FunctionAgent>(
        "b_fast", AgentType::Chat, [](const AgentRequest&) {
            return json("fast done");
        }));

    // Ties go to a_slow first
    std::thread blocker([&] { executor.execute_distributed("first"); });
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(pool->active_task_count("a_slow"), 1u);

    ExecutionResponse r = executor.execute_distributed("second");
    EXPECT_EQ(r.agent_id.value_or(""), "b_fast");
    EXPECT_EQ(r.content, "fast done");

    release = true;
    blocker.join();
    EXPECT_EQ(pool->active_task_count("a_slow"), 0u);
}

// ===========================================================================
// Registration churn while dispatching
// ===========================================================================

TEST(ConcurrentDispatchTest, DeregistrationDuringDispatchIsSafe) {
    auto pool = std::make_shared<AgentPoolManager>();
    Executor executor(std::make_shared<Router>(), LocalAgents{}, nullptr, pool);

    pool->register_agent(std::make_shared<FunctionAgent>(
        "stable", AgentType::Chat, [](const AgentRequest&) { return json("ok"); }));

    std::atomic<bool> stop{false};
    std::atomic<int> errors{0};

    std::thread churn([&] {
        int i = 0;
        while (!stop.load()) {
            AgentId id = "transient_" + std::to_string(i++ % 3);
            pool->register_agent(std::make_shared<FunctionAgent>(
                id, AgentType::Chat, [](const AgentRequest&) { return json("ok"); }));
            pool->deregister_agent(id);
        }
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int op = 0; op < 200; ++op) {
                try {
                    executor.execute_distributed("ping");
                } catch (const std::exception&) {
                    ++errors;
                }
            }
        });
    }

    for (auto& w : workers) w.join();
    stop = true;
    churn.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(pool->active_task_count("stable"), 0u);
}
