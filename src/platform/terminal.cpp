#include "terminal.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <sys/ioctl.h>
#  include <unistd.h>
#  include <poll.h>
#endif

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
#endif
}

int term_height() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
    return 24;
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
#endif
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    return WaitForSingleObject(h, timeout_ms) == WAIT_OBJECT_0;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
#endif
}

// ── Yes/no prompt ────────────────────────────────────────────

bool parse_yes_no(const std::string& input, bool* answer) {
    std::string value = input;
    trim(value);
    value = to_lower(value);
    if (value == "y" || value == "yes") { *answer = true; return true; }
    if (value == "n" || value == "no") { *answer = false; return true; }
    return false;
}

TerminalPrompter::LineStatus TerminalPrompter::read_line(std::string& line,
                                                         InterruptSource& interrupts) {
    line.clear();
    while (true) {
        if (interrupts.pending()) {
            return LineStatus::INTERRUPTED;
        }
        if (!poll_stdin(PROMPT_POLL_MS)) {
            continue;
        }
        char c;
#ifdef _WIN32
        int n = _read(0, &c, 1);
#else
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
#endif
        if (n < 0) {
            // EINTR from SIGINT lands here; the flag decides on the next pass
            continue;
        }
        if (n == 0) {
            return line.empty() ? LineStatus::END_OF_INPUT : LineStatus::LINE;
        }
        if (c == '\n') {
            return LineStatus::LINE;
        }
        line += c;
    }
}

bool TerminalPrompter::confirm(const std::string& question, bool default_answer,
                               bool interrupt_answer, InterruptSource& interrupts) {
    const char* choices = default_answer ? "[Y/n]" : "[y/N]";

    while (true) {
        out_ << question << " " << choices << " " << std::flush;

        std::string line;
        switch (read_line(line, interrupts)) {
            case LineStatus::INTERRUPTED:
                interrupts.clear();
                out_ << "\n";
                return interrupt_answer;
            case LineStatus::END_OF_INPUT:
                out_ << "\n";
                return default_answer;
            case LineStatus::LINE:
                break;
        }

        std::string value = line;
        trim(value);
        if (value.empty()) {
            return default_answer;
        }
        bool answer = false;
        if (parse_yes_no(value, &answer)) {
            return answer;
        }
    }
}

} // namespace platform
