#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "command.hpp"
#include "executor.hpp"
#include "session_key.hpp"
#include "transport.hpp"

// How Session::write_file / read_file reach paths the login user cannot.
struct FileOptions {
    // Go through a temporary copy in /tmp moved (or copied) with sudo
    bool use_sudo = false;
    // Impersonated user for the move/copy; root when unset
    std::optional<std::string> sudo_user;
    // "user" or "user:group", applied with sudo chown after writing
    std::optional<std::string> owner;
    // chmod mode, applied with sudo after writing
    std::optional<std::string> permissions;
    bool silent = false;
};

// SSH session with one host, possibly reached through a chain of gateways.
//
// A Session owns its connection and every Session obtained from it with
// get_remote_session(). Closing (or destroying) a Session closes that whole
// subtree, children first. A child keeps a plain pointer to its gateway,
// used only to ask for a tunnel when (re)opening.
//
// A Session must not be driven from two threads at once.
class Session {
public:
    Session(std::string host, std::string username,
            std::optional<std::string> password = std::nullopt,
            std::optional<std::string> private_key_file = std::nullopt,
            int port = SSH_PORT,
            std::shared_ptr<Transport> transport = default_transport());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Connect unless already active. `retry` extra attempts (-1 = forever),
    // `retry_interval` apart. Throws ConnectionFailure when they run out.
    Session& open(int retry = 0,
                  std::chrono::milliseconds retry_interval =
                      std::chrono::seconds(DEFAULT_CONNECT_RETRY_INTERVAL_SECS));

    // Idempotent. Children are closed before our own connection.
    void close();

    bool is_active() const;

    // Session on `host` tunnelled through this one. The user defaults to
    // ours. A live session with the same (host, port, user) is returned as
    // is; a dead one is discarded and replaced.
    Session& get_remote_session(const std::string& host, int port = SSH_PORT,
                                std::optional<std::string> username = std::nullopt,
                                std::optional<std::string> password = std::nullopt,
                                std::optional<std::string> private_key_file = std::nullopt,
                                int retry = 0,
                                std::chrono::milliseconds retry_interval =
                                    std::chrono::seconds(DEFAULT_CONNECT_RETRY_INTERVAL_SECS));

    CommandResult run_cmd(const CommandRequest& request);

    std::string get_cmd_output(const CommandRequest& request);

    // Exit code of the last attempt; never raises NonZeroExit.
    int get_exit_code(CommandRequest request);

    // `ls` on the path, silently, optionally through sudo.
    bool exists(const std::string& path, bool use_sudo = false);

    // Small files over SFTP. Transfer failures raise JumplineError, failing
    // sudo steps raise NonZeroExit.
    void write_file(const std::string& remote_path, const std::string& content,
                    const FileOptions& options = {});
    std::string read_file(const std::string& remote_path, const FileOptions& options = {});

    // Interrupt source, prompter and echo stream for commands run here.
    // Sessions created afterwards through get_remote_session inherit them.
    void set_execution_hooks(const ExecutionHooks& hooks) { hooks_ = hooks; }

    const std::string& host() const { return host_; }
    int port() const { return port_; }
    const std::string& username() const { return username_; }
    Endpoint endpoint() const { return Endpoint{host_, port_}; }
    Session* parent() const { return parent_; }
    uint64_t id() const { return id_; }
    size_t remote_session_count() const { return remote_sessions_.size(); }

private:
    std::string host_;
    int port_;
    std::string username_;
    std::optional<std::string> password_;
    std::optional<std::string> private_key_file_;
    std::shared_ptr<Transport> transport_;
    Session* parent_ = nullptr;
    uint64_t id_;
    int retry_nb_ = 0;

    std::unique_ptr<Connection> connection_;
    std::unordered_map<SessionKey, std::unique_ptr<Session>, SessionKeyHash> remote_sessions_;
    ExecutionHooks hooks_;

    Credentials credentials() const;
    void run_file_command(const std::string& command, const std::optional<std::string>& sudo_user);
    void close_remote_sessions();
};
