#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

class Libssh2Channel : public Channel {
public:
    Libssh2Channel(LIBSSH2_CHANNEL* channel, std::shared_ptr<std::mutex> io_mutex,
                   socket_t sock, std::shared_ptr<std::atomic<bool>> alive);
    ~Libssh2Channel() override;

    Libssh2Channel(const Libssh2Channel&) = delete;
    Libssh2Channel& operator=(const Libssh2Channel&) = delete;

    Result<void> merge_stderr() override;
    Result<void> request_pty() override;
    Result<void> exec(const std::string& command) override;

    bool wait_readable(std::chrono::milliseconds timeout) override;
    std::string read_available() override;

    bool write_ready() override;
    Result<void> write(const std::string& data) override;

    bool exit_status_ready() override;
    int exit_status() override;

    void shutdown_read() override;
    void close() override;
    bool closed() override;

private:
    LIBSSH2_CHANNEL* channel_;
    std::shared_ptr<std::mutex> io_mutex_;
    socket_t sock_;
    std::shared_ptr<std::atomic<bool>> alive_;
    bool read_shut_ = false;
    bool closed_ = false;
    int exit_status_ = -1;
};

class Libssh2Connection : public Connection {
public:
    Libssh2Connection(Endpoint endpoint, LIBSSH2_SESSION* session, socket_t sock,
                      std::unique_ptr<TunnelStream> tunnel);
    ~Libssh2Connection() override;

    Libssh2Connection(const Libssh2Connection&) = delete;
    Libssh2Connection& operator=(const Libssh2Connection&) = delete;

    bool is_connected() const override;

    Result<std::unique_ptr<Channel>> open_channel() override;
    Result<std::unique_ptr<TunnelStream>> open_tunnel(const std::string& host, int port) override;

    Result<std::string> read_file(const std::string& path) override;
    Result<void> write_file(const std::string& path, const std::string& content) override;

    void keep_running(std::unique_ptr<Channel> channel) override;

    void disconnect() override;

private:
    Endpoint endpoint_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::unique_ptr<TunnelStream> tunnel_;   // set when carried by a parent connection
    std::shared_ptr<std::mutex> io_mutex_;
    std::shared_ptr<std::atomic<bool>> alive_;
    std::vector<std::unique_ptr<Channel>> running_;   // abandoned commands left running
};

// Opens libssh2 sessions. Host keys are accepted on first sight and pinned
// per endpoint for the life of the transport (or until forget_host).
class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Result<std::unique_ptr<Connection>> connect(const Endpoint& endpoint,
                                                const Credentials& credentials,
                                                Connection* via = nullptr) override;

    void forget_host(const Endpoint& endpoint) override;

private:
    std::mutex known_hosts_mutex_;
    std::map<std::string, std::string> known_hosts_;   // "host:port" -> SHA256 fingerprint

    Result<void> verify_host_key(LIBSSH2_SESSION* session, const Endpoint& endpoint);
    Result<void> authenticate(LIBSSH2_SESSION* session, const Credentials& credentials);
};
