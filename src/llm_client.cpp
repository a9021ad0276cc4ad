#include "agentdispatch/llm_client.hpp"

namespace agentdispatch {

namespace {

// {"content": "..."} nested under a message object
const json* message_content(const json& message) {
    if (!message.is_object()) return nullptr;
    auto it = message.find("content");
    if (it == message.end() || !it->is_string()) return nullptr;
    return &*it;
}

} // anonymous namespace

std::string extract_response_content(const json& response) {
    if (response.is_string()) {
        return response.get<std::string>();
    }

    if (response.is_object()) {
        // Ollama chat style
        if (auto msg = response.find("message"); msg != response.end()) {
            if (const json* content = message_content(*msg)) {
                return content->get<std::string>();
            }
        }

        // OpenAI style
        if (auto choices = response.find("choices");
            choices != response.end() && choices->is_array() && !choices->empty()) {
            const json& first = choices->front();
            if (first.is_object()) {
                if (auto msg = first.find("message"); msg != first.end()) {
                    if (const json* content = message_content(*msg)) {
                        return content->get<std::string>();
                    }
                }
            }
        }
    }

    if (response.is_null()) return "";
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace agentdispatch
