#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <core/types.hpp>

// Transport seam. The session layer only talks to these interfaces; the
// libssh2 implementation lives in libssh2_transport.hpp and tests plug in
// a scripted fake.

// One command channel on an authenticated connection.
class Channel {
public:
    virtual ~Channel() = default;

    // Route stderr into the regular output stream.
    virtual Result<void> merge_stderr() = 0;
    virtual Result<void> request_pty() = 0;
    virtual Result<void> exec(const std::string& command) = 0;

    // Block until data may be readable or `timeout` passes. A negative
    // timeout waits without bound. Spurious wake-ups are allowed.
    virtual bool wait_readable(std::chrono::milliseconds timeout) = 0;

    // All bytes available right now (empty when nothing is pending).
    virtual std::string read_available() = 0;

    virtual bool write_ready() = 0;
    virtual Result<void> write(const std::string& data) = 0;

    // Remote side signalled completion (EOF / exit-status received).
    virtual bool exit_status_ready() = 0;

    // Exit status of the remote command, -1 when it cannot be obtained.
    virtual int exit_status() = 0;

    // We will not read from this channel any more.
    virtual void shutdown_read() = 0;
    virtual void close() = 0;
    virtual bool closed() = 0;
};

// Raw bidirectional byte stream to (host, port) carried by a connection.
// A nested connection runs its SSH session over `fd()`.
class TunnelStream {
public:
    virtual ~TunnelStream() = default;

    virtual int fd() const = 0;
    virtual bool is_open() const = 0;
};

// One authenticated connection to one host.
class Connection {
public:
    virtual ~Connection() = default;

    virtual bool is_connected() const = 0;

    virtual Result<std::unique_ptr<Channel>> open_channel() = 0;
    virtual Result<std::unique_ptr<TunnelStream>> open_tunnel(const std::string& host, int port) = 0;

    virtual Result<std::string> read_file(const std::string& path) = 0;
    virtual Result<void> write_file(const std::string& path, const std::string& content) = 0;

    // Take a channel whose remote command must keep running after its
    // caller gave up on it. Held open until disconnect().
    virtual void keep_running(std::unique_ptr<Channel> channel) = 0;

    virtual void disconnect() = 0;
};

// Factory for connections, direct or through a parent connection.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::unique_ptr<Connection>> connect(const Endpoint& endpoint,
                                                        const Credentials& credentials,
                                                        Connection* via = nullptr) = 0;

    // Drop cached host identity for an endpoint so the next connection
    // verifies it afresh.
    virtual void forget_host(const Endpoint& endpoint) = 0;
};

// Process-wide libssh2 transport.
std::shared_ptr<Transport> default_transport();
