#include "errors.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <utility>

static std::string with_cause(const std::string& msg, const std::string& cause) {
    return cause.empty() ? msg : msg + ": " + cause;
}

ConnectionFailure::ConnectionFailure(const std::string& msg, const std::string& cause)
    : JumplineError(with_cause(msg, cause)), cause_(cause) {}

static std::string exit_message(int exit_code, const std::set<int>& success,
                                const std::string& command, const std::string& output,
                                int attempts) {
    std::string msg = fmt::format("Command ({}) returned exit status ({}), expected [{}]",
                                  command, exit_code, fmt::join(success, ","));
    if (attempts > 1) {
        msg += fmt::format(" after {} attempts", attempts);
    }
    return msg + ": " + output;
}

NonZeroExit::NonZeroExit(int exit_code, std::set<int> success_exit_code,
                         std::string command, std::string output, int attempts)
    : JumplineError(exit_message(exit_code, success_exit_code, command, output, attempts)),
      exit_code_(exit_code),
      success_exit_code_(std::move(success_exit_code)),
      command_(std::move(command)),
      output_(std::move(output)),
      attempts_(attempts) {}

CommandInterrupted::CommandInterrupted(std::string command)
    : command_(std::move(command)),
      message_("Interrupted while running remote command '" + command_ + "'") {}
