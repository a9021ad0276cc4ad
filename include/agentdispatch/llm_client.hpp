#pragma once

#include "agentdispatch/types.hpp"

#include <string>
#include <vector>

namespace agentdispatch {

// Outbound LLM inference contract used by the router's classifier.
// Implementations report transport or provider failures by throwing
// (LlmClientException or any std::exception); the router recovers.
class LlmClient {
public:
    virtual ~LlmClient() = default;

    virtual json chat_completion(const std::vector<ChatMessage>& messages,
                                 const std::string& llm_type,
                                 double temperature,
                                 int max_tokens,
                                 double top_p) = 0;
};

// Normalizes a provider response to its assistant text. Understands a bare
// string, {"message": {"content": ...}} and
// {"choices": [{"message": {"content": ...}}]}; anything else is returned
// as its serialized JSON.
std::string extract_response_content(const json& response);

} // namespace agentdispatch
