#pragma once

#include <set>
#include <stdexcept>
#include <string>

// Base of every error raised by the session layer. The message already
// carries the context needed to diagnose the failure without re-running.
class JumplineError : public std::runtime_error {
public:
    explicit JumplineError(const std::string& msg) : std::runtime_error(msg) {}
};

// Connecting to a host failed after the retry budget was spent.
class ConnectionFailure : public JumplineError {
public:
    ConnectionFailure(const std::string& msg, const std::string& cause = "");

    const std::string& cause() const { return cause_; }

private:
    std::string cause_;
};

// One attempt of a remote command ran longer than its timeout.
class CommandTimeout : public JumplineError {
public:
    using JumplineError::JumplineError;
};

// Malformed request, rejected before any I/O.
class InvalidArgument : public JumplineError {
public:
    using JumplineError::JumplineError;
};

// Remote command exited outside its success set once retries ran out.
class NonZeroExit : public JumplineError {
public:
    NonZeroExit(int exit_code, std::set<int> success_exit_code,
                std::string command, std::string output, int attempts);

    int exit_code() const { return exit_code_; }
    const std::set<int>& success_exit_code() const { return success_exit_code_; }
    const std::string& command() const { return command_; }
    const std::string& output() const { return output_; }
    int attempts() const { return attempts_; }

private:
    int exit_code_;
    std::set<int> success_exit_code_;
    std::string command_;
    std::string output_;
    int attempts_;
};

// Failed HTTP call through curl, malformed response or invalid JSON body.
class RestError : public JumplineError {
public:
    using JumplineError::JumplineError;
};

// User interrupted a running command. Deliberately outside the JumplineError
// hierarchy so generic error handlers let it through.
class CommandInterrupted : public std::exception {
public:
    explicit CommandInterrupted(std::string command);

    const char* what() const noexcept override { return message_.c_str(); }
    const std::string& command() const { return command_; }

private:
    std::string command_;
    std::string message_;
};
