#pragma once

#include <chrono>
#include <initializer_list>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace YAML { class Node; }

// A remote command: one string, or fragments run in sequence (joined with
// " && ").
class CommandLine {
public:
    CommandLine(const char* command) : fragments_{command ? command : ""} {}
    CommandLine(std::string command) : fragments_{std::move(command)} {}
    CommandLine(std::vector<std::string> fragments)
        : fragments_(std::move(fragments)), is_list_(true) {}

    // Scalar or sequence of scalars. Any other shape is InvalidArgument.
    static CommandLine from_yaml(const YAML::Node& node);

    // Throws InvalidArgument for an empty command, an empty fragment list
    // or an empty fragment.
    std::string joined() const;

    const std::vector<std::string>& fragments() const { return fragments_; }
    bool is_list() const { return is_list_; }

private:
    std::vector<std::string> fragments_;
    bool is_list_ = false;
};

// Exit codes that count as success. Defaults to {0}.
class SuccessCodes {
public:
    SuccessCodes() : values_{0} {}
    SuccessCodes(int code) : values_{code} {}
    SuccessCodes(std::initializer_list<int> codes) : values_(codes) {}
    SuccessCodes(std::set<int> codes) : values_(std::move(codes)) {}

    static SuccessCodes from_yaml(const YAML::Node& node);

    bool contains(int code) const { return values_.count(code) > 0; }
    bool empty() const { return values_.empty(); }
    const std::set<int>& values() const { return values_; }

private:
    std::set<int> values_;
};

// What may be said about a command in logs and errors.
//   off     everything is logged
//   on      nothing is logged, errors show the redaction marker
//   redact  every match of the patterns is replaced by the marker
class Silence {
public:
    enum class Kind { OFF, ON, REDACT };

    static Silence off() { return Silence(Kind::OFF); }
    static Silence on() { return Silence(Kind::ON); }
    // Throws InvalidArgument when a pattern is not a valid regex.
    static Silence redact(const std::vector<std::string>& patterns);

    Kind kind() const { return kind_; }
    bool is_off() const { return kind_ == Kind::OFF; }
    bool suppresses_log() const { return kind_ == Kind::ON; }
    const std::vector<std::string>& patterns() const { return patterns_; }

    // Text safe to show for `text` under this policy.
    std::string conceal(const std::string& text) const;

private:
    explicit Silence(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::vector<std::string> patterns_;
    std::vector<std::regex> compiled_;
};

struct CommandRequest {
    CommandLine command;
    std::optional<std::string> username;        // run through sudo as this user
    bool raise_if_error = true;
    bool continuous_output = false;
    Silence silent = Silence::off();
    std::optional<std::chrono::milliseconds> timeout;   // per attempt
    std::vector<std::pair<std::string, std::string>> input_data;  // pattern -> reply
    SuccessCodes success_exit_code;
    int retry = 0;                               // -1 retries forever
    std::chrono::milliseconds retry_interval{5000};
    bool keep_retry_history = false;
    bool terminate_by_default = true;            // default answer of the interrupt prompt

    CommandRequest(const char* cmd) : command(cmd) {}
    CommandRequest(std::string cmd) : command(std::move(cmd)) {}
    CommandRequest(std::vector<std::string> fragments) : command(std::move(fragments)) {}
    CommandRequest(CommandLine cmd) : command(std::move(cmd)) {}
};

struct AttemptRecord {
    int exit_code = -1;
    std::string output;
};

struct CommandResult {
    int exit_code = -1;
    std::string output;
    std::string command;          // joined, before sudo wrapping
    int attempts = 0;
    std::set<int> success_exit_code;
    std::vector<AttemptRecord> history;   // filled only with keep_retry_history
};

// A validated request, ready to be sent.
struct PreparedCommand {
    std::string joined;     // what the caller asked for
    std::string remote;     // what the host executes
    std::string for_log;    // what logs and errors may show
};

// Validates `request` and derives the strings used to run it. Throws
// InvalidArgument before any I/O happens.
PreparedCommand prepare_command(const CommandRequest& request);

// sudo su - <user> -c "<command>" with embedded double quotes escaped.
std::string impersonate(const std::string& command, const std::string& user);
