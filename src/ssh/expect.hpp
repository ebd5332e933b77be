#pragma once

#include <string>
#include <utility>
#include <vector>
#include <regex>

struct Pattern {
    std::regex regex;
    std::string raw;

    // ECMAScript syntax. Throws InvalidArgument when `pattern` does not compile.
    explicit Pattern(const std::string& pattern);
};

// Answers prompts of an interactive remote command. Every pattern is
// searched in each chunk of output; a match queues its reply followed by
// a newline. The same pattern answers again whenever it matches again.
class InputResponder {
public:
    InputResponder() = default;
    explicit InputResponder(const std::vector<std::pair<std::string, std::string>>& input_data);

    bool empty() const { return entries_.empty(); }

    // Replies owed for `chunk`, in input-map order.
    std::vector<std::string> replies_for(const std::string& chunk) const;

private:
    std::vector<std::pair<Pattern, std::string>> entries_;
};
