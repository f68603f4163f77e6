#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "upstream/upstream_api.hpp"

#include <atomic>
#include <expected>
#include <memory>
#include <string>

class LinuxEventLoop {
public:
    // With no `upstream`, init() reads the token and builds the Vercel client.
    explicit LinuxEventLoop(Config config, bool verbose = false,
                            std::unique_ptr<UpstreamApi> upstream = nullptr);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Credential, upstream client and listening socket. Safe to call before
    // daemonizing; nothing is accepted until run().
    std::expected<void, StartError> init();

    // Set up signal handling in the calling process, accept until a signal or
    // request_stop(), then drain and clean up. Returns false if the event
    // sources could not be created.
    bool run();

    // Safe to call from any thread or after init().
    void request_stop();

    const std::string& socket_path() const { return socket_path_; }
    size_t active_connections() const { return core_ ? core_->active_connections() : 0; }

private:
    // epoll and signalfd belong to the process that serves, so they are
    // created here rather than in init().
    bool setup_events();
    void set_accepting(bool on);
    void shutdown();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    std::string socket_path_;

    // Destroyed in reverse: core_ drains before the server and upstream go away.
    std::unique_ptr<UpstreamApi> upstream_;
    UnixSocketServer ipc_server_;
    std::unique_ptr<DaemonCore> core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int wake_fd_ = -1;
    bool accept_paused_ = false;

    std::atomic<bool> running_{false};
};
