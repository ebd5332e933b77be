#pragma once

#include <iosfwd>
#include <string>
#include <platform/interrupt.hpp>
#include "command.hpp"
#include "expect.hpp"
#include "transport.hpp"

// Where a running command reports to and listens for cancellation.
// Null members fall back to SIGINT, the terminal and std::cout.
struct ExecutionHooks {
    InterruptSource* interrupts = nullptr;
    Prompter* prompter = nullptr;
    std::ostream* echo = nullptr;
};

// Runs one CommandRequest on a connection: one fresh channel per attempt,
// attempts strictly sequential.
class CommandExecutor {
public:
    CommandExecutor(Connection& connection, std::string host, std::string user,
                    ExecutionHooks hooks = {});

    // Throws InvalidArgument, ConnectionFailure, CommandTimeout,
    // NonZeroExit (when raise_if_error) and CommandInterrupted.
    CommandResult run(const CommandRequest& request);
    CommandResult run(const CommandRequest& request, const PreparedCommand& prepared);

private:
    enum class AttemptState {
        CONNECTING,
        EXECUTING,
        DRAINING,
        COMPLETED,
        TIMED_OUT,
        INTERRUPTED,
    };

    Connection& connection_;
    std::string host_;
    std::string user_;
    ExecutionHooks hooks_;

    AttemptRecord run_attempt(const CommandRequest& request, const PreparedCommand& prepared,
                              const InputResponder& responder, InterruptSource& interrupts);

    std::unique_ptr<Channel> start_channel(const PreparedCommand& prepared);

    // Drains what the channel has, echoes it and answers prompts.
    // Returns false when nothing was available.
    bool pump_output(Channel& channel, const CommandRequest& request,
                     const InputResponder& responder, std::string& output);

    // Asks whether to stop the remote command and acts on the answer.
    // Returns true when the command is left running. The caller throws
    // CommandInterrupted afterwards.
    bool handle_interrupt(Channel& channel, const CommandRequest& request,
                          const PreparedCommand& prepared, InterruptSource& interrupts);

    static const char* state_name(AttemptState state);
};
