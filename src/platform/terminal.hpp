#pragma once

#include <iostream>
#include <string>
#include "interrupt.hpp"

namespace platform {

// Get terminal dimensions (used for the remote pseudo-terminal size).
int term_width();
int term_height();

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Interprets "y", "yes", "n", "no" (any case, surrounding blanks ignored).
// Returns true and sets *answer when `input` is one of those.
bool parse_yes_no(const std::string& input, bool* answer);

// Asks on stdout and reads a line from stdin. Invalid answers re-ask.
class TerminalPrompter : public Prompter {
public:
    explicit TerminalPrompter(std::ostream& out = std::cout) : out_(out) {}

    bool confirm(const std::string& question, bool default_answer,
                 bool interrupt_answer, InterruptSource& interrupts) override;

private:
    std::ostream& out_;

    enum class LineStatus { LINE, END_OF_INPUT, INTERRUPTED };
    LineStatus read_line(std::string& line, InterruptSource& interrupts);
};

} // namespace platform
