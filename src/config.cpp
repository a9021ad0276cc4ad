#include "agentdispatch/config.hpp"
#include "agentdispatch/exceptions.hpp"

#include <fstream>

namespace agentdispatch {

namespace {

template <typename T>
void read_field(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

} // anonymous namespace

Config config_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigException("Configuration root must be a JSON object");
    }

    Config cfg;
    try {
        if (auto it = doc.find("router"); it != doc.end()) {
            read_field(*it, "fast_path_threshold", cfg.router.fast_path_threshold);
            read_field(*it, "short_request_max_tokens", cfg.router.short_request_max_tokens);
            read_field(*it, "llm_type", cfg.router.llm_type);
            read_field(*it, "temperature", cfg.router.temperature);
            read_field(*it, "max_tokens", cfg.router.max_tokens);
            read_field(*it, "top_p", cfg.router.top_p);
        }

        if (auto it = doc.find("executor"); it != doc.end()) {
            read_field(*it, "code_search_keywords", cfg.executor.code_search_keywords);
            read_field(*it, "classification_keywords", cfg.executor.classification_keywords);
            read_field(*it, "additional_info_heading", cfg.executor.additional_info_heading);
            read_field(*it, "final_fallback_message", cfg.executor.final_fallback_message);
        }

        if (auto it = doc.find("pool"); it != doc.end()) {
            std::int64_t interval_ms = -1;
            read_field(*it, "health_check_interval_ms", interval_ms);
            if (interval_ms > 0) {
                cfg.pool.health_check_interval = std::chrono::milliseconds(interval_ms);
            }
            read_field(*it, "emit_snapshots", cfg.pool.emit_snapshots);
        }
    } catch (const json::exception& e) {
        throw ConfigException(std::string("Invalid configuration value: ") + e.what());
    }

    if (cfg.router.fast_path_threshold < 0.0 || cfg.router.fast_path_threshold > 1.0) {
        throw ConfigException("router.fast_path_threshold must be within [0, 1]");
    }
    return cfg;
}

Config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException("Failed to open config file: " + path);
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigException("Failed to parse config file " + path + ": " + e.what());
    }
    return config_from_json(doc);
}

} // namespace agentdispatch
