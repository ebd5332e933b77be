#pragma once

#include <string>
#include <optional>
#include <utility>
#include <vector>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Where to reach a host
struct Endpoint {
    std::string host;
    int port = 22;

    std::string str() const { return host + ":" + std::to_string(port); }
};

// Authentication material for one hop
struct Credentials {
    std::string username;
    std::optional<std::string> password;
    std::optional<std::string> private_key_file;
};

// One hop of the gateway chain as read from configuration
struct HopConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> private_key_file;
    int retry = 0;
    int retry_interval = 10;
};

// Defaults applied to `jumpline run`
struct RunDefaults {
    std::optional<int> timeout;
    int retry = 0;
    int retry_interval = 5;
    std::vector<int> success_exit_code{0};
    std::optional<std::string> sudo_user;
};

struct LogConfig {
    std::string file;
    std::string level = "info";
};
