#pragma once

// Scripted in-memory transport for session and executor tests.

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <platform/interrupt.hpp>
#include <ssh/transport.hpp>

// How one exec'd command behaves.
struct ScriptedCommand {
    std::vector<std::string> chunks;        // delivered one per read
    int exit_code = 0;
    bool never_completes = false;
    std::chrono::milliseconds runs_for{0};  // completion no earlier than this after exec
    std::string wait_for_input;             // completion waits for a write containing this
    std::vector<std::string> after_input;   // delivered once that write arrives
};

struct FakeWorld {
    std::function<ScriptedCommand(const std::string& host, const std::string& command)> script =
        [](const std::string&, const std::string&) { return ScriptedCommand{}; };

    std::vector<std::string> executed;      // commands as sent to hosts
    std::vector<std::string> writes;        // stdin written to channels
    std::vector<std::string> connects;      // "host:port" or "host:port via gw:port"
    std::vector<std::string> forgotten;     // forget_host calls
    std::vector<std::string> disconnects;   // Connection::disconnect calls, in order
    std::map<std::string, int> failures;    // host -> connect attempts left to fail
    std::map<std::string, std::string> files;
    int channels_opened = 0;
    int channels_closed = 0;
    int channels_freed = 0;
    int channels_kept = 0;                  // handed back to the connection still running

    std::map<std::string, std::vector<std::shared_ptr<std::atomic<bool>>>> alive;

    // Simulate the remote end going away for every connection to `host`.
    void drop(const std::string& host) {
        for (auto& flag : alive[host]) flag->store(false);
    }
};

class FakeChannel : public Channel {
public:
    FakeChannel(std::shared_ptr<FakeWorld> world, std::string host)
        : world_(std::move(world)), host_(std::move(host)) {}
    ~FakeChannel() override { world_->channels_freed++; }

    Result<void> merge_stderr() override { return Result<void>::Ok(); }
    Result<void> request_pty() override { return Result<void>::Ok(); }

    Result<void> exec(const std::string& command) override {
        world_->executed.push_back(command);
        script_ = world_->script(host_, command);
        started_ = std::chrono::steady_clock::now();
        pending_.assign(script_.chunks.begin(), script_.chunks.end());
        return Result<void>::Ok();
    }

    bool wait_readable(std::chrono::milliseconds timeout) override {
        if (!pending_.empty() || completed()) return true;
        auto nap = std::chrono::milliseconds(5);
        if (timeout.count() >= 0 && timeout < nap) nap = timeout;
        std::this_thread::sleep_for(nap);
        return false;
    }

    std::string read_available() override {
        if (pending_.empty() || read_shut_) return "";
        std::string chunk = pending_.front();
        pending_.pop_front();
        return chunk;
    }

    bool write_ready() override { return !closed_; }

    Result<void> write(const std::string& data) override {
        world_->writes.push_back(data);
        if (!script_.wait_for_input.empty() && !input_received_ &&
            data.find(script_.wait_for_input) != std::string::npos) {
            input_received_ = true;
            pending_.insert(pending_.end(), script_.after_input.begin(), script_.after_input.end());
        }
        return Result<void>::Ok();
    }

    bool exit_status_ready() override { return completed(); }
    int exit_status() override { return completed() ? script_.exit_code : -1; }

    void shutdown_read() override { read_shut_ = true; }

    void close() override {
        if (!closed_) world_->channels_closed++;
        closed_ = true;
    }

    bool closed() override { return closed_ || completed(); }

private:
    std::shared_ptr<FakeWorld> world_;
    std::string host_;
    ScriptedCommand script_;
    std::deque<std::string> pending_;
    bool input_received_ = false;
    bool read_shut_ = false;
    bool closed_ = false;
    std::chrono::steady_clock::time_point started_;

    bool completed() const {
        if (script_.never_completes) return false;
        if (std::chrono::steady_clock::now() - started_ < script_.runs_for) return false;
        return script_.wait_for_input.empty() || input_received_;
    }
};

class FakeTunnel : public TunnelStream {
public:
    explicit FakeTunnel(std::shared_ptr<std::atomic<bool>> parent_alive)
        : parent_alive_(std::move(parent_alive)) {}

    int fd() const override { return -1; }
    bool is_open() const override { return parent_alive_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> parent_alive_;
};

class FakeConnection : public Connection {
public:
    FakeConnection(std::shared_ptr<FakeWorld> world, Endpoint endpoint,
                   std::unique_ptr<TunnelStream> tunnel)
        : world_(std::move(world)), endpoint_(std::move(endpoint)), tunnel_(std::move(tunnel)),
          alive_(std::make_shared<std::atomic<bool>>(true)) {
        world_->alive[endpoint_.host].push_back(alive_);
    }

    bool is_connected() const override {
        if (!alive_->load()) return false;
        return !tunnel_ || tunnel_->is_open();
    }

    Result<std::unique_ptr<Channel>> open_channel() override {
        if (!is_connected()) return Result<std::unique_ptr<Channel>>::Err("not connected");
        world_->channels_opened++;
        return Result<std::unique_ptr<Channel>>::Ok(std::make_unique<FakeChannel>(world_, endpoint_.host));
    }

    Result<std::unique_ptr<TunnelStream>> open_tunnel(const std::string&, int) override {
        if (!is_connected()) return Result<std::unique_ptr<TunnelStream>>::Err("gateway gone");
        return Result<std::unique_ptr<TunnelStream>>::Ok(std::make_unique<FakeTunnel>(alive_));
    }

    Result<std::string> read_file(const std::string& path) override {
        auto it = world_->files.find(endpoint_.host + ":" + path);
        if (it == world_->files.end()) return Result<std::string>::Err("No such file");
        return Result<std::string>::Ok(it->second);
    }

    Result<void> write_file(const std::string& path, const std::string& content) override {
        world_->files[endpoint_.host + ":" + path] = content;
        return Result<void>::Ok();
    }

    void keep_running(std::unique_ptr<Channel> channel) override {
        world_->channels_kept++;
        running_.push_back(std::move(channel));
    }

    void disconnect() override {
        running_.clear();
        world_->disconnects.push_back(endpoint_.str());
        alive_->store(false);
    }

private:
    std::shared_ptr<FakeWorld> world_;
    Endpoint endpoint_;
    std::unique_ptr<TunnelStream> tunnel_;
    std::shared_ptr<std::atomic<bool>> alive_;
    std::vector<std::unique_ptr<Channel>> running_;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeWorld> world) : world_(std::move(world)) {}

    Result<std::unique_ptr<Connection>> connect(const Endpoint& endpoint, const Credentials&,
                                                Connection* via) override {
        using ConnResult = Result<std::unique_ptr<Connection>>;

        std::unique_ptr<TunnelStream> tunnel;
        if (via) {
            auto t = via->open_tunnel(endpoint.host, endpoint.port);
            if (t.is_err()) return ConnResult::Err(t.error);
            tunnel = std::move(t.value);
            world_->connects.push_back(endpoint.str() + " via tunnel");
        } else {
            world_->connects.push_back(endpoint.str());
        }

        auto it = world_->failures.find(endpoint.host);
        if (it != world_->failures.end() && it->second > 0) {
            it->second--;
            return ConnResult::Err("Connection refused");
        }

        return ConnResult::Ok(std::make_unique<FakeConnection>(world_, endpoint, std::move(tunnel)));
    }

    void forget_host(const Endpoint& endpoint) override {
        world_->forgotten.push_back(endpoint.str());
    }

private:
    std::shared_ptr<FakeWorld> world_;
};

class FakeInterrupt : public InterruptSource {
public:
    bool pending() const override { return flag_.load(); }
    void clear() override { flag_.store(false); }
    void fire() { flag_.store(true); }

private:
    std::atomic<bool> flag_{false};
};

class FakePrompter : public Prompter {
public:
    bool answer = true;
    bool fire_again = false;            // simulate a second Ctrl-C while asking
    std::vector<std::string> questions;
    std::vector<bool> defaults;
    bool flag_was_cleared = true;

    bool confirm(const std::string& question, bool default_answer, bool interrupt_answer,
                 InterruptSource& interrupts) override {
        questions.push_back(question);
        defaults.push_back(default_answer);
        flag_was_cleared = !interrupts.pending();
        if (fire_again) {
            return interrupt_answer;
        }
        return answer;
    }
};
