#include "libssh2_transport.hpp"
#include "tunnel_pump.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

// ── Helpers ────────────────────────────────────────────────────

// Call a non-blocking libssh2 function until it stops returning EAGAIN
// or the deadline passes. Each call holds the io_mutex briefly.
template <typename Fn>
static int call_until_done(std::mutex& io_mutex, Fn&& fn,
                           int timeout_secs = CHANNEL_OPEN_TIMEOUT_SECS) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN || std::chrono::steady_clock::now() >= deadline) {
            return rc;
        }
        platform::sleep_ms(10);
    }
}

static std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown libssh2 error";
}

static bool is_socket_error(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_DISCONNECT;
}

static void init_libssh2_once() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

// ── Libssh2Channel ─────────────────────────────────────────────

Libssh2Channel::Libssh2Channel(LIBSSH2_CHANNEL* channel, std::shared_ptr<std::mutex> io_mutex,
                               socket_t sock, std::shared_ptr<std::atomic<bool>> alive)
    : channel_(channel), io_mutex_(std::move(io_mutex)), sock_(sock), alive_(std::move(alive)) {
}

Libssh2Channel::~Libssh2Channel() {
    if (channel_) {
        call_until_done(*io_mutex_, [&] { return libssh2_channel_free(channel_); });
        channel_ = nullptr;
    }
}

Result<void> Libssh2Channel::merge_stderr() {
    int rc = call_until_done(*io_mutex_, [&] {
        return libssh2_channel_handle_extended_data2(channel_, LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);
    });
    if (rc != 0) return Result<void>::Err(fmt::format("Failed to merge stderr (rc={})", rc));
    return Result<void>::Ok();
}

Result<void> Libssh2Channel::request_pty() {
    int tw = platform::term_width();
    int th = platform::term_height();
    int rc = call_until_done(*io_mutex_, [&] {
        return libssh2_channel_request_pty_ex(channel_, SSH_PTY_TERM,
                                              static_cast<unsigned int>(std::strlen(SSH_PTY_TERM)),
                                              nullptr, 0, tw, th, 0, 0);
    });
    if (rc != 0) return Result<void>::Err(fmt::format("Failed to request pty (rc={})", rc));
    return Result<void>::Ok();
}

Result<void> Libssh2Channel::exec(const std::string& command) {
    int rc = call_until_done(*io_mutex_, [&] {
        return libssh2_channel_exec(channel_, command.c_str());
    });
    if (rc != 0) return Result<void>::Err(fmt::format("Failed to exec command on channel (rc={})", rc));
    return Result<void>::Ok();
}

bool Libssh2Channel::wait_readable(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        // Packets may already be queued by a read on another channel
        if (libssh2_poll_channel_read(channel_, 0) || libssh2_channel_eof(channel_)) {
            return true;
        }
    }
    int timeout_ms = timeout.count() < 0 ? -1 : static_cast<int>(timeout.count());
    int revents = platform::poll_socket(sock_, POLLIN, timeout_ms);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        alive_->store(false);
    }
    return revents != 0;
}

std::string Libssh2Channel::read_available() {
    std::string out;
    if (read_shut_ || closed_) return out;

    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(channel_, buf, sizeof(buf));
        }
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            log_debug(fmt::format("channel read error (rc={})", n));
            if (is_socket_error(static_cast<int>(n))) alive_->store(false);
        }
        break;
    }
    return out;
}

bool Libssh2Channel::write_ready() {
    if (closed_) return false;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_channel_window_write(channel_) > 0;
}

Result<void> Libssh2Channel::write(const std::string& data) {
    size_t sent = 0;
    int write_retries = 0;
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 1000) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)");
            }
            platform::sleep_ms(10);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(fmt::format("Channel write error (rc={})", w));
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

bool Libssh2Channel::exit_status_ready() {
    if (closed_) return true;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_channel_eof(channel_) == 1;
}

int Libssh2Channel::exit_status() {
    if (!closed_ && exit_status_ready()) {
        close();
    }
    return exit_status_;
}

void Libssh2Channel::shutdown_read() {
    read_shut_ = true;
}

void Libssh2Channel::close() {
    if (closed_) return;
    closed_ = true;

    int rc = call_until_done(*io_mutex_, [&] { return libssh2_channel_close(channel_); });
    if (rc == 0) {
        call_until_done(*io_mutex_, [&] { return libssh2_channel_wait_closed(channel_); });
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_status_ = libssh2_channel_get_exit_status(channel_);
    }
}

bool Libssh2Channel::closed() {
    if (closed_) return true;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_channel_eof(channel_) == 1;
}

// ── Libssh2Connection ──────────────────────────────────────────

Libssh2Connection::Libssh2Connection(Endpoint endpoint, LIBSSH2_SESSION* session, socket_t sock,
                                     std::unique_ptr<TunnelStream> tunnel)
    : endpoint_(std::move(endpoint)), session_(session), sock_(sock), tunnel_(std::move(tunnel)),
      io_mutex_(std::make_shared<std::mutex>()),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
}

Libssh2Connection::~Libssh2Connection() {
    disconnect();
}

bool Libssh2Connection::is_connected() const {
    if (!session_ || !alive_->load()) return false;
    if (tunnel_ && !tunnel_->is_open()) return false;

    int revents = platform::poll_socket(sock_, 0, 0);
    return (revents & (POLLERR | POLLHUP | POLLNVAL)) == 0;
}

Result<std::unique_ptr<Channel>> Libssh2Connection::open_channel() {
    using ChannelResult = Result<std::unique_ptr<Channel>>;
    if (!session_) return ChannelResult::Err("Connection is closed");

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return ChannelResult::Err("Failed to open SSH channel: " + last_error(session_));
            }
        }
        if (ch) break;
        platform::sleep_ms(10);
    }
    if (!ch) return ChannelResult::Err("Timed out opening SSH channel");

    return ChannelResult::Ok(std::make_unique<Libssh2Channel>(ch, io_mutex_, sock_, alive_));
}

Result<std::unique_ptr<TunnelStream>> Libssh2Connection::open_tunnel(const std::string& host, int port) {
    using TunnelResult = Result<std::unique_ptr<TunnelStream>>;
    if (!session_) return TunnelResult::Err("Connection is closed");

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_direct_tcpip_ex(session_, host.c_str(), port, "127.0.0.1", SSH_PORT);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return TunnelResult::Err(fmt::format("direct-tcpip to {}:{} refused by {}: {}",
                                                     host, port, endpoint_.str(), last_error(session_)));
            }
        }
        if (ch) break;
        platform::sleep_ms(10);
    }
    if (!ch) return TunnelResult::Err(fmt::format("Timed out opening tunnel to {}:{}", host, port));

    socket_t sv[2];
    auto pair = platform::socket_pair(sv);
    if (pair.is_err()) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch);
        return TunnelResult::Err(pair.error);
    }

    auto pump = std::make_unique<TunnelPump>(ch, io_mutex_, sock_, sv[0], sv[1]);
    pump->start();
    log_debug(fmt::format("tunnel to {}:{} opened through {}", host, port, endpoint_.str()));
    return TunnelResult::Ok(std::move(pump));
}

// SFTP calls run in blocking mode while the io_mutex is held, the tunnel
// pumps of nested connections simply wait for the lock.
Result<std::string> Libssh2Connection::read_file(const std::string& path) {
    if (!session_) return Result<std::string>::Err("Connection is closed");

    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_session_set_blocking(session_, 1);

    LIBSSH2_SFTP* sftp = libssh2_sftp_init(session_);
    if (!sftp) {
        libssh2_session_set_blocking(session_, 0);
        return Result<std::string>::Err("Failed to start SFTP: " + last_error(session_));
    }

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp, path.c_str(), LIBSSH2_FXF_READ, 0);
    if (!fh) {
        libssh2_sftp_shutdown(sftp);
        libssh2_session_set_blocking(session_, 0);
        return Result<std::string>::Err("Cannot open remote file: " + path);
    }

    std::string content;
    char buf[SFTP_BUF_SIZE];
    ssize_t n;
    while ((n = libssh2_sftp_read(fh, buf, sizeof(buf))) > 0) {
        content.append(buf, static_cast<size_t>(n));
    }

    libssh2_sftp_close(fh);
    libssh2_sftp_shutdown(sftp);
    libssh2_session_set_blocking(session_, 0);

    if (n < 0) {
        return Result<std::string>::Err(fmt::format("SFTP read of {} failed (rc={})", path, n));
    }
    return Result<std::string>::Ok(content);
}

Result<void> Libssh2Connection::write_file(const std::string& path, const std::string& content) {
    if (!session_) return Result<void>::Err("Connection is closed");

    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_session_set_blocking(session_, 1);

    LIBSSH2_SFTP* sftp = libssh2_sftp_init(session_);
    if (!sftp) {
        libssh2_session_set_blocking(session_, 0);
        return Result<void>::Err("Failed to start SFTP: " + last_error(session_));
    }

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp, path.c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
    if (!fh) {
        libssh2_sftp_shutdown(sftp);
        libssh2_session_set_blocking(session_, 0);
        return Result<void>::Err("Cannot create remote file: " + path);
    }

    size_t sent = 0;
    ssize_t rc = 0;
    while (sent < content.size()) {
        rc = libssh2_sftp_write(fh, content.data() + sent, content.size() - sent);
        if (rc <= 0) break;
        sent += static_cast<size_t>(rc);
    }

    libssh2_sftp_close(fh);
    libssh2_sftp_shutdown(sftp);
    libssh2_session_set_blocking(session_, 0);

    if (sent != content.size()) {
        return Result<void>::Err(fmt::format("SFTP write of {} failed (rc={})", path, rc));
    }
    return Result<void>::Ok();
}

void Libssh2Connection::keep_running(std::unique_ptr<Channel> channel) {
    running_.push_back(std::move(channel));
}

void Libssh2Connection::disconnect() {
    alive_->store(false);

    // Channels are freed while their session still exists
    running_.clear();

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_set_blocking(session_, 1);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (tunnel_) {
        // The socketpair end belongs to the tunnel
        tunnel_.reset();
    } else if (sock_ != JUMPLINE_INVALID_SOCKET) {
        platform::close_socket(sock_);
    }
    sock_ = JUMPLINE_INVALID_SOCKET;
}

// ── Libssh2Transport ───────────────────────────────────────────

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

Libssh2Transport::Libssh2Transport() {
    init_libssh2_once();
}

Libssh2Transport::~Libssh2Transport() = default;

Result<void> Libssh2Transport::verify_host_key(LIBSSH2_SESSION* session, const Endpoint& endpoint) {
    const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!hash) {
        return Result<void>::Err("Server did not provide a host key");
    }
    std::string fingerprint(hash, 32);

    std::lock_guard<std::mutex> lock(known_hosts_mutex_);
    auto it = known_hosts_.find(endpoint.str());
    if (it == known_hosts_.end()) {
        known_hosts_[endpoint.str()] = fingerprint;
        return Result<void>::Ok();
    }
    if (it->second != fingerprint) {
        return Result<void>::Err("Host key for " + endpoint.str() + " changed since last connection");
    }
    return Result<void>::Ok();
}

void Libssh2Transport::forget_host(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(known_hosts_mutex_);
    known_hosts_.erase(endpoint.str());
}

Result<void> Libssh2Transport::authenticate(LIBSSH2_SESSION* session, const Credentials& credentials) {
    const std::string& user = credentials.username;
    char* auth_list = libssh2_userauth_list(session, user.c_str(), static_cast<unsigned int>(user.length()));
    if (!auth_list && libssh2_userauth_authenticated(session)) {
        return Result<void>::Ok();   // "none" auth accepted
    }
    std::string methods = auth_list ? auth_list : "";
    const char* passphrase = credentials.password ? credentials.password->c_str() : nullptr;

    // Explicit key file first
    if (credentials.private_key_file && methods.find("publickey") != std::string::npos) {
        int rc = libssh2_userauth_publickey_fromfile(session, user.c_str(), nullptr,
                                                     credentials.private_key_file->c_str(), passphrase);
        if (rc == 0) return Result<void>::Ok();
        log_debug(fmt::format("publickey auth with {} failed: {}",
                              *credentials.private_key_file, last_error(session)));
    }

    if (credentials.password) {
        if (methods.empty() || methods.find("password") != std::string::npos) {
            if (libssh2_userauth_password(session, user.c_str(), credentials.password->c_str()) == 0) {
                return Result<void>::Ok();
            }
        }
        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdAuthData kbd_data{*credentials.password};
            *libssh2_session_abstract(session) = &kbd_data;
            int rc = libssh2_userauth_keyboard_interactive(session, user.c_str(), kbd_callback);
            *libssh2_session_abstract(session) = nullptr;
            if (rc == 0) return Result<void>::Ok();
        }
    }

    // Fall back to the usual key files in ~/.ssh
    if (!credentials.private_key_file && methods.find("publickey") != std::string::npos) {
        for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
            fs::path key = platform::home_dir() / ".ssh" / name;
            if (!fs::exists(key)) continue;
            if (libssh2_userauth_publickey_fromfile(session, user.c_str(), nullptr,
                                                    key.string().c_str(), passphrase) == 0) {
                return Result<void>::Ok();
            }
        }
    }

    return Result<void>::Err(fmt::format("Authentication failed for user '{}' (server offers: {})",
                                         user, methods.empty() ? "unknown" : methods));
}

Result<std::unique_ptr<Connection>> Libssh2Transport::connect(const Endpoint& endpoint,
                                                              const Credentials& credentials,
                                                              Connection* via) {
    using ConnResult = Result<std::unique_ptr<Connection>>;

    std::unique_ptr<TunnelStream> tunnel;
    socket_t sock = JUMPLINE_INVALID_SOCKET;

    if (via) {
        auto tunnel_result = via->open_tunnel(endpoint.host, endpoint.port);
        if (tunnel_result.is_err()) return ConnResult::Err(tunnel_result.error);
        tunnel = std::move(tunnel_result.value);
        sock = static_cast<socket_t>(tunnel->fd());
    } else {
        auto sock_result = platform::connect_tcp(endpoint.host, endpoint.port,
                                                 SSH_CONNECT_TIMEOUT_SECS * 1000);
        if (sock_result.is_err()) return ConnResult::Err(sock_result.error);
        sock = sock_result.value;
        platform::enable_keepalive(sock);
    }

    auto release_socket = [&] {
        if (!tunnel) platform::close_socket(sock);
    };

    LIBSSH2_SESSION* session = libssh2_session_init();
    if (!session) {
        release_socket();
        return ConnResult::Err("Failed to create SSH session");
    }

    // Handshake and authentication run blocking, bounded by a session timeout
    libssh2_session_set_blocking(session, 1);
    libssh2_session_set_timeout(session, SSH_CONNECT_TIMEOUT_SECS * 1000L);

    auto fail = [&](const std::string& reason) {
        libssh2_session_disconnect(session, reason.c_str());
        libssh2_session_free(session);
        release_socket();
        return ConnResult::Err(reason);
    };

    if (libssh2_session_handshake(session, sock) != 0) {
        return fail("SSH handshake with " + endpoint.str() + " failed: " + last_error(session));
    }

    auto host_key = verify_host_key(session, endpoint);
    if (host_key.is_err()) return fail(host_key.error);

    auto auth = authenticate(session, credentials);
    if (auth.is_err()) return fail(auth.error);

    libssh2_session_set_timeout(session, 0);
    libssh2_session_set_blocking(session, 0);
    libssh2_keepalive_config(session, 1, 30);

    return ConnResult::Ok(std::make_unique<Libssh2Connection>(endpoint, session, sock, std::move(tunnel)));
}

std::shared_ptr<Transport> default_transport() {
    static std::shared_ptr<Transport> transport = std::make_shared<Libssh2Transport>();
    return transport;
}
