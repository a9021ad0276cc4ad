#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agentdispatch::detail {

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream in(s);
    std::string token;
    while (in >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

std::vector<std::string> normalized_words(const std::string& s) {
    std::vector<std::string> words;
    for (auto& token : split_whitespace(to_lower(s))) {
        auto first = std::find_if(token.begin(), token.end(), [](unsigned char c) {
            return !std::ispunct(c);
        });
        auto last = std::find_if(token.rbegin(), token.rend(), [](unsigned char c) {
            return !std::ispunct(c);
        }).base();
        if (first < last) {
            words.emplace_back(first, last);
        }
    }
    return words;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace agentdispatch::detail
