#pragma once

#include <string>
#include <vector>

namespace agentdispatch::detail {

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

// Whitespace-separated tokens, unmodified
std::vector<std::string> split_whitespace(const std::string& s);

// Lowercased words with surrounding punctuation stripped ("Hello," -> "hello")
std::vector<std::string> normalized_words(const std::string& s);

bool contains(const std::string& haystack, const std::string& needle);

} // namespace agentdispatch::detail
