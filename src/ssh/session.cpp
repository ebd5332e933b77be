#include "session.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>

static std::atomic<uint64_t> g_next_session_id{1};

Session::Session(std::string host, std::string username,
                 std::optional<std::string> password,
                 std::optional<std::string> private_key_file,
                 int port,
                 std::shared_ptr<Transport> transport)
    : host_(std::move(host)),
      port_(port),
      username_(std::move(username)),
      password_(std::move(password)),
      private_key_file_(std::move(private_key_file)),
      transport_(std::move(transport)),
      id_(g_next_session_id.fetch_add(1)) {
}

Session::~Session() {
    close();
}

Credentials Session::credentials() const {
    Credentials creds;
    creds.username = username_;
    creds.password = password_;
    creds.private_key_file = private_key_file_;
    return creds;
}

bool Session::is_active() const {
    return connection_ && connection_->is_connected();
}

Session& Session::open(int retry, std::chrono::milliseconds retry_interval) {
    if (is_active()) {
        return *this;
    }
    if (retry_interval.count() < 0) {
        throw InvalidArgument("Connect retry interval must not be negative");
    }

    Endpoint ep = endpoint();
    std::string failure = fmt::format("Unable to connect to '{}' with user '{}'", ep.str(), username_);

    if (parent_ && !parent_->is_active()) {
        throw ConnectionFailure(failure,
            fmt::format("gateway '{}' is not active", parent_->endpoint().str()));
    }

    // A stale connection (remote end gone) is dropped before dialling again.
    // Children tunnel through it, so they go first.
    if (connection_) {
        close_remote_sessions();
        connection_->disconnect();
        connection_.reset();
    }

    retry_nb_ = 0;
    while (true) {
        Connection* via = parent_ ? parent_->connection_.get() : nullptr;
        auto result = transport_->connect(ep, credentials(), via);
        if (result.is_ok()) {
            connection_ = std::move(result.value);
            break;
        }

        // Negative retry means retry forever
        if (retry < 0 || retry_nb_ < retry) {
            log_warning(fmt::format("ssh to '{}' still not possible (attempt {}): {}. Keep retrying...",
                                    ep.str(), retry_nb_, result.error));
            retry_nb_++;
            platform::sleep_for(retry_interval);
            continue;
        }
        throw ConnectionFailure(failure, result.error);
    }

    log_info(fmt::format("Successfully connected to '{}'", ep.str()));
    return *this;
}

void Session::close_remote_sessions() {
    for (auto& entry : remote_sessions_) {
        entry.second->close();
    }
}

void Session::close() {
    close_remote_sessions();

    if (connection_) {
        if (connection_->is_connected()) {
            log_debug(fmt::format("Closing connection to '{}'...", endpoint().str()));
        }
        connection_->disconnect();
        connection_.reset();
        // The next connection may reach a different machine behind the same address
        transport_->forget_host(endpoint());
    }
}

Session& Session::get_remote_session(const std::string& host, int port,
                                     std::optional<std::string> username,
                                     std::optional<std::string> password,
                                     std::optional<std::string> private_key_file,
                                     int retry, std::chrono::milliseconds retry_interval) {
    if (!is_active()) {
        open();
    }

    std::string user = (username && !username->empty()) ? *username : username_;
    SessionKey key(host, port, user);

    auto it = remote_sessions_.find(key);
    if (it != remote_sessions_.end()) {
        if (it->second->is_active()) {
            return *it->second;
        }
        remote_sessions_.erase(it);
    }

    log_info(fmt::format("Connecting to '{}:{}' through '{}' with user '{}'...", host, port, host_, user));

    auto remote = std::make_unique<Session>(host, user, std::move(password), std::move(private_key_file),
                                            port, transport_);
    remote->parent_ = this;
    remote->hooks_ = hooks_;
    remote->open(retry, retry_interval);

    Session& ref = *remote;
    remote_sessions_.emplace(key, std::move(remote));
    return ref;
}

CommandResult Session::run_cmd(const CommandRequest& request) {
    PreparedCommand prepared = prepare_command(request);

    if (!is_active()) {
        open();
    }

    CommandExecutor executor(*connection_, host_, username_, hooks_);
    return executor.run(request, prepared);
}

std::string Session::get_cmd_output(const CommandRequest& request) {
    return run_cmd(request).output;
}

int Session::get_exit_code(CommandRequest request) {
    request.raise_if_error = false;
    return run_cmd(request).exit_code;
}

bool Session::exists(const std::string& path, bool use_sudo) {
    CommandRequest request((use_sudo ? "sudo ls " : "ls ") + path);
    request.silent = Silence::on();
    return get_exit_code(request) == 0;
}

void Session::run_file_command(const std::string& command,
                               const std::optional<std::string>& sudo_user) {
    CommandRequest request(command);
    request.silent = Silence::on();
    request.username = sudo_user;
    run_cmd(request);
}

void Session::write_file(const std::string& remote_path, const std::string& content,
                         const FileOptions& options) {
    if (!is_active()) {
        open();
    }
    if (!options.silent) {
        log_debug(fmt::format("Create file '{}' on remote host '{}' as '{}'", remote_path, host_, username_));
    }

    std::string copy_path = options.use_sudo ? "/tmp/" + random_id(15) : remote_path;
    auto result = connection_->write_file(copy_path, content);
    if (result.is_err()) {
        throw JumplineError(fmt::format("Unable to write '{}' on '{}': {}", copy_path, host_, result.error));
    }

    std::string target = shell_single_quote(remote_path);
    if (options.use_sudo) {
        run_file_command(fmt::format("mv {} {}", shell_single_quote(copy_path), target),
                         options.sudo_user.value_or("root"));
    }
    if (options.owner) {
        std::string owner = *options.owner;
        if (owner.find(':') == std::string::npos) {
            owner += ":" + owner;
        }
        run_file_command(fmt::format("sudo chown {} {}", owner, target), std::nullopt);
    }
    if (options.permissions) {
        run_file_command(fmt::format("sudo chmod {} {}", *options.permissions, target), std::nullopt);
    }
}

std::string Session::read_file(const std::string& remote_path, const FileOptions& options) {
    if (!is_active()) {
        open();
    }
    if (!options.silent) {
        log_debug(fmt::format("Read file '{}' on remote host '{}' as '{}'", remote_path, host_, username_));
    }

    // A sudo read goes through a copy the login user can open
    std::string copy_path = remote_path;
    std::optional<std::string> sudo_user;
    if (options.use_sudo) {
        sudo_user = options.sudo_user.value_or("root");
        copy_path = "/tmp/" + random_id(15);
        run_file_command(fmt::format("cp {} {}", shell_single_quote(remote_path),
                                     shell_single_quote(copy_path)), sudo_user);
    }

    auto result = connection_->read_file(copy_path);

    if (options.use_sudo) {
        CommandRequest cleanup("rm -f " + shell_single_quote(copy_path));
        cleanup.silent = Silence::on();
        cleanup.username = sudo_user;
        cleanup.raise_if_error = false;
        if (run_cmd(cleanup).exit_code != 0) {
            log_warning(fmt::format("Unable to remove temporary copy '{}' on '{}'", copy_path, host_));
        }
    }

    if (result.is_err()) {
        throw JumplineError(fmt::format("Unable to read '{}' on '{}': {}", remote_path, host_, result.error));
    }
    return result.value;
}
