#pragma once

// AgentDispatch: Request Routing Core for Multi-Agent Systems
//
// Classifies free-text requests, runs them on in-process agents with
// multi-agent synthesis and fallback, or dispatches them to a pool of
// health-tracked agents by affinity, preference and load.

// Core
#include "agentdispatch/types.hpp"
#include "agentdispatch/result.hpp"
#include "agentdispatch/exceptions.hpp"
#include "agentdispatch/config.hpp"
#include "agentdispatch/monitor.hpp"
#include "agentdispatch/agent.hpp"
#include "agentdispatch/capability.hpp"
#include "agentdispatch/llm_client.hpp"

// Routing and execution
#include "agentdispatch/agent_pool.hpp"
#include "agentdispatch/router.hpp"
#include "agentdispatch/executor.hpp"
