#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Relays a direct-tcpip channel to one end of a local socketpair.
//
//   parent session ──direct-tcpip──> channel  <─pump─>  local_sock
//                                                         │ socketpair
//   nested libssh2 session  ─────────────────────────>  inner_sock (fd())
//
// The channel belongs to the parent's libssh2 session, so every library
// call goes through the parent's io_mutex.
class TunnelPump : public TunnelStream {
public:
    TunnelPump(LIBSSH2_CHANNEL* channel, std::shared_ptr<std::mutex> io_mutex,
               socket_t outer_sock, socket_t local_sock, socket_t inner_sock);
    ~TunnelPump() override;

    TunnelPump(const TunnelPump&) = delete;
    TunnelPump& operator=(const TunnelPump&) = delete;

    void start();

    int fd() const override { return static_cast<int>(inner_sock_); }
    bool is_open() const override { return !finished_.load(); }

private:
    LIBSSH2_CHANNEL* channel_;
    std::shared_ptr<std::mutex> io_mutex_;
    socket_t outer_sock_;
    socket_t local_sock_;
    socket_t inner_sock_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;

    void run();
    bool channel_to_local(char* buf, int len);
    bool local_to_channel(char* buf, int len);
};
