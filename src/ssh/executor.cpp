#include "executor.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iostream>
#include <memory>

using Clock = std::chrono::steady_clock;

CommandExecutor::CommandExecutor(Connection& connection, std::string host, std::string user,
                                 ExecutionHooks hooks)
    : connection_(connection), host_(std::move(host)), user_(std::move(user)), hooks_(hooks) {
}

const char* CommandExecutor::state_name(AttemptState state) {
    switch (state) {
        case AttemptState::CONNECTING:  return "connecting";
        case AttemptState::EXECUTING:   return "executing";
        case AttemptState::DRAINING:    return "draining";
        case AttemptState::COMPLETED:   return "completed";
        case AttemptState::TIMED_OUT:   return "timed out";
        case AttemptState::INTERRUPTED: return "interrupted";
    }
    return "unknown";
}

CommandResult CommandExecutor::run(const CommandRequest& request) {
    return run(request, prepare_command(request));
}

CommandResult CommandExecutor::run(const CommandRequest& request, const PreparedCommand& prepared) {
    InputResponder responder(request.input_data);

    // Without an injected source, SIGINT is watched for the duration of the run
    std::unique_ptr<platform::SigintWatch> sigint;
    InterruptSource* interrupts = hooks_.interrupts;
    if (!interrupts) {
        sigint = std::make_unique<platform::SigintWatch>();
        interrupts = sigint.get();
    }

    if (!request.silent.suppresses_log()) {
        log_debug(fmt::format("Running command '{}' on '{}' as {}...", prepared.for_log, host_,
                              request.username ? *request.username : user_));
    }

    CommandResult result;
    result.command = prepared.joined;
    result.success_exit_code = request.success_exit_code.values();

    int retries = 0;
    while (true) {
        AttemptRecord attempt = run_attempt(request, prepared, responder, *interrupts);

        result.exit_code = attempt.exit_code;
        result.output = attempt.output;
        result.attempts = retries + 1;
        if (request.keep_retry_history) {
            result.history.push_back(attempt);
        }

        if (request.success_exit_code.contains(attempt.exit_code)) {
            break;
        }

        if (request.retry < 0 || retries < request.retry) {
            retries++;
            if (!request.silent.suppresses_log()) {
                log_debug(fmt::format("Command '{}' returned exit status {}, retry {} in {}ms",
                                      prepared.for_log, attempt.exit_code, retries,
                                      request.retry_interval.count()));
            }
            platform::sleep_for(request.retry_interval);
            continue;
        }

        if (request.raise_if_error) {
            throw NonZeroExit(attempt.exit_code, request.success_exit_code.values(),
                              prepared.for_log, attempt.output, result.attempts);
        }
        break;
    }

    return result;
}

std::unique_ptr<Channel> CommandExecutor::start_channel(const PreparedCommand& prepared) {
    auto opened = connection_.open_channel();
    if (opened.is_err()) {
        throw ConnectionFailure(fmt::format("Unable to open a channel on '{}'", host_), opened.error);
    }
    std::unique_ptr<Channel> channel = std::move(opened.value);

    auto merged = channel->merge_stderr();
    if (merged.is_err()) {
        throw ConnectionFailure(fmt::format("Unable to set up a channel on '{}'", host_), merged.error);
    }
    auto pty = channel->request_pty();
    if (pty.is_err()) {
        throw ConnectionFailure(fmt::format("Unable to set up a channel on '{}'", host_), pty.error);
    }
    auto exec = channel->exec(prepared.remote);
    if (exec.is_err()) {
        throw ConnectionFailure(fmt::format("Unable to start command '{}' on '{}'", prepared.for_log, host_),
                                exec.error);
    }
    return channel;
}

bool CommandExecutor::pump_output(Channel& channel, const CommandRequest& request,
                                  const InputResponder& responder, std::string& output) {
    std::string data = channel.read_available();
    if (data.empty()) {
        return false;
    }
    output += data;

    if (request.continuous_output && request.silent.is_off()) {
        std::ostream& echo = hooks_.echo ? *hooks_.echo : std::cout;
        echo << data << std::flush;
    }

    if (!responder.empty() && channel.write_ready()) {
        for (const auto& reply : responder.replies_for(data)) {
            auto sent = channel.write(reply);
            if (sent.is_err()) {
                log_warning(fmt::format("Could not answer prompt on '{}': {}", host_, sent.error));
            }
        }
    }
    return true;
}

AttemptRecord CommandExecutor::run_attempt(const CommandRequest& request, const PreparedCommand& prepared,
                                           const InputResponder& responder, InterruptSource& interrupts) {
    AttemptState state = AttemptState::CONNECTING;
    std::unique_ptr<Channel> channel = start_channel(prepared);

    state = AttemptState::EXECUTING;
    auto start = Clock::now();
    std::string output;

    while (state != AttemptState::COMPLETED) {
        auto slice = std::chrono::milliseconds(INTERRUPT_POLL_MS);
        if (request.timeout) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            auto remaining = *request.timeout - elapsed;
            slice = std::max(std::chrono::milliseconds(0), std::min(slice, remaining));
        }
        channel->wait_readable(slice);

        if (interrupts.pending()) {
            state = AttemptState::INTERRUPTED;
            log_debug(fmt::format("attempt on '{}' {}", host_, state_name(state)));
            if (handle_interrupt(*channel, request, prepared, interrupts)) {
                // Freeing the channel would close it and kill the command
                connection_.keep_running(std::move(channel));
            }
            throw CommandInterrupted(prepared.for_log);
        }

        bool got_chunk = pump_output(*channel, request, responder, output);

        if (!got_chunk && channel->exit_status_ready()) {
            state = AttemptState::DRAINING;
            // Bytes may land between the read and the completion signal
            if (pump_output(*channel, request, responder, output)) {
                state = AttemptState::EXECUTING;
                continue;
            }
            channel->shutdown_read();
            channel->close();
            state = AttemptState::COMPLETED;
            break;
        }

        if (request.timeout && Clock::now() - start > *request.timeout) {
            state = AttemptState::TIMED_OUT;
            log_debug(fmt::format("attempt on '{}' {}", host_, state_name(state)));
            channel->close();
            double secs = static_cast<double>(request.timeout->count()) / 1000.0;
            throw CommandTimeout(fmt::format(
                "Timeout of {:g}s reached when calling command '{}'. "
                "Increase timeout if you think the command was still running successfully.",
                secs, prepared.for_log));
        }
    }

    AttemptRecord record;
    record.exit_code = channel->exit_status();
    record.output = output;
    trim(record.output);
    log_debug(fmt::format("attempt on '{}' {} with exit status {}", host_, state_name(state), record.exit_code));
    return record;
}

bool CommandExecutor::handle_interrupt(Channel& channel, const CommandRequest& request,
                                       const PreparedCommand& prepared, InterruptSource& interrupts) {
    interrupts.clear();

    if (!connection_.is_connected()) {
        return false;
    }

    platform::TerminalPrompter terminal;
    Prompter& prompter = hooks_.prompter ? *hooks_.prompter : terminal;

    bool terminate = prompter.confirm(
        fmt::format("Terminate remote command '{}'?", prepared.for_log),
        request.terminate_by_default, false, interrupts);
    if (!terminate) {
        return true;
    }

    // The channel may have closed while the question was pending
    if (channel.closed()) {
        int exit_code = channel.exit_status();
        if (exit_code == -1) {
            log_warning("Unable to terminate remote command because channel is closed.");
        } else {
            log_info(fmt::format("Remote command execution already finished with exit code {}", exit_code));
        }
        return false;
    }

    auto sent = channel.write(INTERRUPT_SEQUENCE);
    if (sent.is_err()) {
        log_warning(fmt::format("Could not forward interrupt to '{}': {}", host_, sent.error));
    }
    channel.close();
    return false;
}
