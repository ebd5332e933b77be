#include "expect.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>

Pattern::Pattern(const std::string& pattern) : raw(pattern) {
    try {
        regex = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw InvalidArgument(fmt::format("Invalid input pattern '{}': {}", pattern, e.what()));
    }
}

InputResponder::InputResponder(const std::vector<std::pair<std::string, std::string>>& input_data) {
    entries_.reserve(input_data.size());
    for (const auto& entry : input_data) {
        entries_.emplace_back(Pattern(entry.first), entry.second);
    }
}

std::vector<std::string> InputResponder::replies_for(const std::string& chunk) const {
    std::vector<std::string> replies;
    if (chunk.empty()) return replies;

    for (const auto& entry : entries_) {
        if (std::regex_search(chunk, entry.first.regex)) {
            replies.push_back(entry.second + "\n");
        }
    }
    return replies;
}
