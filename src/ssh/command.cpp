#include "command.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

// ── CommandLine ────────────────────────────────────────────────

CommandLine CommandLine::from_yaml(const YAML::Node& node) {
    try {
        if (node.IsScalar()) {
            return CommandLine(node.as<std::string>());
        }
        if (node.IsSequence()) {
            std::vector<std::string> fragments;
            for (const auto& item : node) {
                if (!item.IsScalar()) {
                    throw InvalidArgument("Command fragments must be strings");
                }
                fragments.push_back(item.as<std::string>());
            }
            return CommandLine(std::move(fragments));
        }
    } catch (const YAML::Exception& e) {
        throw InvalidArgument(fmt::format("Invalid command: {}", e.what()));
    }
    throw InvalidArgument("Command must be a string or a list of strings");
}

std::string CommandLine::joined() const {
    if (is_list_ && fragments_.empty()) {
        throw InvalidArgument("Command list is empty");
    }

    std::string out;
    for (size_t i = 0; i < fragments_.size(); i++) {
        std::string check = fragments_[i];
        trim(check);
        if (check.empty()) {
            throw InvalidArgument(is_list_
                ? fmt::format("Command fragment #{} is empty", i + 1)
                : std::string("Command is empty"));
        }
        if (i > 0) out += COMMAND_JOINER;
        out += fragments_[i];
    }
    return out;
}

// ── SuccessCodes ───────────────────────────────────────────────

SuccessCodes SuccessCodes::from_yaml(const YAML::Node& node) {
    try {
        if (node.IsScalar()) {
            return SuccessCodes(node.as<int>());
        }
        if (node.IsSequence()) {
            std::set<int> codes;
            for (const auto& item : node) {
                codes.insert(item.as<int>());
            }
            return SuccessCodes(std::move(codes));
        }
    } catch (const YAML::Exception& e) {
        throw InvalidArgument(fmt::format("Invalid success_exit_code: {}", e.what()));
    }
    throw InvalidArgument("success_exit_code must be an integer or a list of integers");
}

// ── Silence ────────────────────────────────────────────────────

Silence Silence::redact(const std::vector<std::string>& patterns) {
    Silence silence(Kind::REDACT);
    silence.patterns_ = patterns;
    for (const auto& p : patterns) {
        try {
            silence.compiled_.emplace_back(p, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw InvalidArgument(fmt::format("Invalid redaction pattern '{}': {}", p, e.what()));
        }
    }
    return silence;
}

std::string Silence::conceal(const std::string& text) const {
    switch (kind_) {
        case Kind::OFF:
            return text;
        case Kind::ON:
            return REDACTION_MARKER;
        case Kind::REDACT:
            break;
    }
    std::string out = text;
    for (const auto& re : compiled_) {
        out = std::regex_replace(out, re, REDACTION_MARKER);
    }
    return out;
}

// ── Preparation ────────────────────────────────────────────────

std::string impersonate(const std::string& command, const std::string& user) {
    return fmt::format("sudo su - {} -c \"{}\"", user, replace_all(command, "\"", "\\\""));
}

PreparedCommand prepare_command(const CommandRequest& request) {
    PreparedCommand prepared;
    prepared.joined = request.command.joined();

    if (request.success_exit_code.empty()) {
        throw InvalidArgument("success_exit_code must contain at least one exit code");
    }
    if (request.timeout && request.timeout->count() < 0) {
        throw InvalidArgument(fmt::format("Timeout must not be negative (got {}ms)",
                                          request.timeout->count()));
    }
    if (request.retry_interval.count() < 0) {
        throw InvalidArgument(fmt::format("Retry interval must not be negative (got {}ms)",
                                          request.retry_interval.count()));
    }
    for (const auto& entry : request.input_data) {
        try {
            std::regex(entry.first, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw InvalidArgument(fmt::format("Invalid input pattern '{}': {}", entry.first, e.what()));
        }
    }

    prepared.remote = prepared.joined;
    if (request.username && !request.username->empty()) {
        prepared.remote = impersonate(prepared.joined, *request.username);
    }
    prepared.for_log = request.silent.conceal(prepared.joined);
    return prepared;
}
