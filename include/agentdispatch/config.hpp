#pragma once

#include "agentdispatch/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace agentdispatch {

// Router classification settings
struct RouterConfig {
    // Pattern decisions strictly above this skip the LLM classifier
    double fast_path_threshold = 0.8;

    // Unmatched requests with at most this many tokens go to chat
    std::size_t short_request_max_tokens = 10;

    // LLM classification call parameters
    std::string llm_type = "task";
    double temperature = 0.1;
    int max_tokens = 300;
    double top_p = 0.9;
};

// Executor behaviour
struct ExecutorConfig {
    // Content affinity for distributed selection (substring, lowercased)
    std::vector<std::string> code_search_keywords = {
        "find the function", "find function", "find the class", "find class",
        "search code", "code search", "search the code", "search the codebase",
        "search for code", "find in code", "locate the function", "find the definition",
        "find definition", "where is the function", "where is the class",
    };
    std::vector<std::string> classification_keywords = {
        "classify", "classification", "categorize", "categorise",
        "what type of request", "what kind of request", "detect intent",
    };

    std::string additional_info_heading = "## Additional Information";

    std::string final_fallback_message =
        "I'm sorry, I wasn't able to process your request right now. "
        "Please try again or rephrase your question.";
};

// Agent pool manager settings
struct PoolConfig {
    // How often the background health monitor probes agents
    Duration health_check_interval = std::chrono::seconds(30);

    // Emit a PoolSnapshot to the monitor after every health sweep
    bool emit_snapshots = true;
};

struct Config {
    RouterConfig router;
    ExecutorConfig executor;
    PoolConfig pool;
};

// Load a Config from a JSON file. Keys that are absent keep their defaults.
// Throws ConfigException if the file cannot be read or parsed.
Config load_config(const std::string& path);

// Same as load_config, from an already parsed document
Config config_from_json(const json& doc);

} // namespace agentdispatch
