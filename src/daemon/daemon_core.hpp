#pragma once

#include "config.hpp"
#include "daemon_context.hpp"
#include "dispatcher.hpp"
#include "method_registry.hpp"
#include "platform/ipc_server.hpp"
#include "upstream/upstream_api.hpp"

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

// Portable request-handling engine: owns one worker thread per accepted
// connection and the drain logic used at shutdown. Platform event loops feed
// it accepted client fds.
class DaemonCore {
public:
    DaemonCore(const Config& config, bool verbose, IpcServer& ipc, UpstreamApi& upstream);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Take ownership of an accepted client fd and serve it on its own thread.
    // Over the connection limit, or if no thread can be started, the client
    // gets one error frame and the fd is closed.
    void serve(int client_fd);

    // Join workers whose connections have already closed. Returns how many.
    size_t reap_finished();

    size_t active_connections() const;

    // Ask every worker to finish its current request and exit. Workers still
    // running after `grace` have their sockets shut down and upstream
    // transfers cancelled. Returns once all workers are joined.
    void drain(std::chrono::milliseconds grace);

    DaemonContext& context() { return ctx_; }

private:
    static constexpr int POLL_TICK_MS = 100;

    struct Worker {
        int fd;
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    void serve_connection(std::stop_token stop, int fd);
    void reject(int fd, const std::string& reason);
    void log(const std::string& msg);

    size_t max_message_bytes_;
    size_t max_connections_;
    bool verbose_;
    IpcServer& ipc_;

    DaemonContext ctx_;
    MethodRegistry registry_;
    Dispatcher dispatcher_;

    mutable std::mutex workers_mu_;
    std::list<Worker> workers_;
};
