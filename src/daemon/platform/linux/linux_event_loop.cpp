#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "upstream/curl_transport.hpp"
#include "upstream/vercel_client.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose, std::unique_ptr<UpstreamApi> upstream)
    : config_(std::move(config)), verbose_(verbose),
      socket_path_(std::filesystem::absolute(config_.server.socket_path.empty()
                                                 ? platform::ipc_endpoint()
                                                 : config_.server.socket_path).string()),
      upstream_(std::move(upstream)) {}

LinuxEventLoop::~LinuxEventLoop() {
    shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

std::expected<void, StartError> LinuxEventLoop::init() {
    auto system_error = [](const char* what) {
        return std::unexpected(StartError{StartError::Kind::System,
                                          std::string(what) + " failed: " + std::strerror(errno)});
    };

    if (!upstream_) {
        auto token = read_token(config_.upstream.token_env);
        if (!token) {
            return std::unexpected(StartError{StartError::Kind::System,
                                              "missing credential: " + token.error()});
        }

        auto transport = std::make_unique<CurlTransport>(CurlTransport::Options{
            .base_url = config_.upstream.base_url,
            .token = std::move(*token),
            .pool_size = config_.upstream.pool_size,
            .timeout_seconds = config_.upstream.timeout_seconds,
            .connect_timeout_seconds = config_.upstream.connect_timeout_seconds,
            .user_agent = std::string("fgp-vercel/") + FGP_VERCEL_VERSION,
        });
        upstream_ = std::make_unique<VercelClient>(
            std::move(transport),
            VercelClient::Options{
                .team_id = config_.upstream.team_id,
                .recheck_interval = std::chrono::seconds(config_.upstream.recheck_seconds),
            },
            verbose_);
    }

    if (auto started = ipc_server_.start(socket_path_); !started) {
        return std::unexpected(started.error());
    }
    log("listening on " + socket_path_);

    core_ = std::make_unique<DaemonCore>(config_, verbose_, ipc_server_, *upstream_);

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) return system_error("eventfd");

    running_.store(true, std::memory_order_release);
    return {};
}

bool LinuxEventLoop::setup_events() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "[fgp-vercel] epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Blocked before any worker starts, so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "[fgp-vercel] signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) || !add_fd(wake_fd_)) {
        std::println(stderr, "[fgp-vercel] epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

void LinuxEventLoop::set_accepting(bool on) {
    epoll_event ev{.events = on ? static_cast<uint32_t>(EPOLLIN) : 0u,
                   .data = {.fd = ipc_server_.server_fd()}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, ipc_server_.server_fd(), &ev) < 0) {
        std::println(stderr, "[fgp-vercel] epoll_ctl failed: {}", std::strerror(errno));
        return;
    }
    accept_paused_ = !on;
}

bool LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    constexpr int REAP_INTERVAL_MS = 1000;
    epoll_event events[MAX_EVENTS];

    if (!core_ || !setup_events()) {
        shutdown();
        return false;
    }

    while (running_.load(std::memory_order_acquire)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, REAP_INTERVAL_MS);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "[fgp-vercel] epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == wake_fd_) {
                uint64_t val;
                if (::read(wake_fd_, &val, sizeof(val)) > 0) {
                    log("stop requested, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                // Drain the accept backlog; the listener is non-blocking.
                int client_fd;
                while ((client_fd = ipc_server_.accept_client()) >= 0) {
                    core_->serve(client_fd);
                }
                if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS || errno == ENOMEM) {
                    // The backlog stays readable; stop polling it until a worker
                    // frees a descriptor or the next tick.
                    std::println(stderr, "[fgp-vercel] accept failed: {}; pausing accepts",
                                 std::strerror(errno));
                    set_accepting(false);
                }
            }
        }

        size_t reaped = core_->reap_finished();
        if (accept_paused_ && (reaped > 0 || n == 0)) {
            set_accepting(true);
        }
    }

    shutdown();
    return true;
}

void LinuxEventLoop::request_stop() {
    if (wake_fd_ >= 0) {
        uint64_t val = 1;
        if (::write(wake_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "[fgp-vercel] wake write failed: {}", std::strerror(errno));
        }
    }
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::shutdown() {
    if (!core_) return;

    ipc_server_.stop_accepting();
    log(std::format("draining {} connection(s)", core_->active_connections()));
    core_->drain(std::chrono::milliseconds(config_.server.shutdown_grace_ms));
    core_.reset();
    upstream_.reset();
    ipc_server_.stop();
    log("stopped");
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[fgp-vercel] {}", msg);
    }
}
