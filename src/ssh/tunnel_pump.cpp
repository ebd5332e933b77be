#include "tunnel_pump.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <vector>
#ifndef _WIN32
#  include <unistd.h>
#  include <sys/socket.h>
#  include <poll.h>
#endif

TunnelPump::TunnelPump(LIBSSH2_CHANNEL* channel, std::shared_ptr<std::mutex> io_mutex,
                       socket_t outer_sock, socket_t local_sock, socket_t inner_sock)
    : channel_(channel), io_mutex_(std::move(io_mutex)),
      outer_sock_(outer_sock), local_sock_(local_sock), inner_sock_(inner_sock) {
}

TunnelPump::~TunnelPump() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();

    platform::close_socket(local_sock_);
    platform::close_socket(inner_sock_);

    if (channel_) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_close(channel_);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
}

void TunnelPump::start() {
    thread_ = std::thread([this] { run(); });
}

// Returns false once the channel reached EOF or failed.
bool TunnelPump::channel_to_local(char* buf, int len) {
    for (;;) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(channel_, buf, len);
        }
        if (n > 0) {
            ssize_t sent = 0;
            while (sent < n) {
#ifdef _WIN32
                int w = ::send(local_sock_, buf + sent, static_cast<int>(n - sent), 0);
#else
                ssize_t w = ::write(local_sock_, buf + sent, n - sent);
#endif
                if (w <= 0) return false;
                sent += w;
            }
            continue;
        }
        if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            return libssh2_channel_eof(channel_) == 0;
        }
        log_debug("tunnel: channel read error " + std::to_string(n));
        return false;
    }
}

// Returns false once the nested session closed its end.
bool TunnelPump::local_to_channel(char* buf, int len) {
#ifdef _WIN32
    int n = ::recv(local_sock_, buf, len, 0);
#else
    ssize_t n = ::read(local_sock_, buf, len);
#endif
    if (n <= 0) return false;

    ssize_t sent = 0;
    while (sent < n && !stop_.load()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(channel_, buf + sent, n - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) { platform::sleep_ms(1); continue; }
        if (w < 0) return false;
        sent += w;
    }
    return true;
}

void TunnelPump::run() {
    std::vector<char> buf(TUNNEL_BUF_SIZE);

    while (!stop_.load()) {
        struct pollfd fds[2];
        fds[0] = {outer_sock_, POLLIN, 0};
        fds[1] = {local_sock_, POLLIN, 0};
        poll(fds, 2, TUNNEL_POLL_MS);

        // Another reader of the parent session may already have queued our
        // packets inside libssh2, so try the channel on every pass.
        if (!channel_to_local(buf.data(), static_cast<int>(buf.size()))) {
            break;
        }

        if (fds[1].revents & (POLLIN | POLLHUP)) {
            if (!local_to_channel(buf.data(), static_cast<int>(buf.size()))) {
                break;
            }
        }
    }

    finished_.store(true);
#ifndef _WIN32
    // Let the nested session see EOF instead of blocking on a dead tunnel
    ::shutdown(local_sock_, SHUT_RDWR);
#endif
}
