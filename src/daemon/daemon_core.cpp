#include "daemon_core.hpp"

#include <format>
#include <print>
#include <system_error>

DaemonCore::DaemonCore(const Config& config, bool verbose, IpcServer& ipc, UpstreamApi& upstream)
    : max_message_bytes_(config.server.max_message_bytes),
      max_connections_(config.server.max_connections), verbose_(verbose), ipc_(ipc),
      ctx_{.upstream = upstream},
      registry_(MethodRegistry::builtin()),
      dispatcher_(registry_, ctx_, verbose) {}

DaemonCore::~DaemonCore() {
    drain(std::chrono::milliseconds(0));
}

void DaemonCore::serve(int client_fd) {
    if (active_connections() >= max_connections_) {
        reject(client_fd, "too many connections");
        return;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::jthread thread;
    try {
        thread = std::jthread([this, client_fd, done](std::stop_token stop) {
            serve_connection(stop, client_fd);
            // Signal EOF to the caller now; the fd itself is closed after join.
            ipc_.interrupt_client(client_fd);
            done->store(true, std::memory_order_release);
        });
    } catch (const std::system_error& e) {
        std::println(stderr, "[fgp-vercel] cannot start connection thread: {}", e.what());
        reject(client_fd, "server busy");
        return;
    }

    std::lock_guard lock(workers_mu_);
    workers_.push_back(Worker{.fd = client_fd, .done = std::move(done), .thread = std::move(thread)});
}

void DaemonCore::reject(int fd, const std::string& reason) {
    log(std::format("connection {} rejected: {}", fd, reason));
    auto resp = Response::failure(std::nullopt, {ErrorKind::Internal, reason});
    if (!ipc_.send_frame(fd, encode_frame(resp))) {
        log(std::format("connection {}: could not deliver rejection", fd));
    }
    ipc_.interrupt_client(fd);
    ipc_.close_client(fd);
}

size_t DaemonCore::reap_finished() {
    std::list<Worker> finished;
    {
        std::lock_guard lock(workers_mu_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load(std::memory_order_acquire)) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        w.thread.join();
        ipc_.close_client(w.fd);
    }
    return finished.size();
}

size_t DaemonCore::active_connections() const {
    std::lock_guard lock(workers_mu_);
    size_t n = 0;
    for (const auto& w : workers_) {
        if (!w.done->load(std::memory_order_acquire)) ++n;
    }
    return n;
}

void DaemonCore::drain(std::chrono::milliseconds grace) {
    std::list<Worker> workers;
    {
        std::lock_guard lock(workers_mu_);
        workers.swap(workers_);
    }
    if (workers.empty()) return;

    for (auto& w : workers) w.thread.request_stop();

    auto deadline = std::chrono::steady_clock::now() + grace;
    auto all_done = [&workers] {
        for (const auto& w : workers) {
            if (!w.done->load(std::memory_order_acquire)) return false;
        }
        return true;
    };
    while (!all_done() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!all_done()) {
        size_t stuck = 0;
        for (auto& w : workers) {
            if (!w.done->load(std::memory_order_acquire)) {
                ipc_.interrupt_client(w.fd);
                ++stuck;
            }
        }
        log(std::format("grace period expired, cancelling {} connection(s)", stuck));
        ctx_.upstream.cancel_inflight();
    }

    for (auto& w : workers) {
        w.thread.join();
        ipc_.close_client(w.fd);
    }
}

void DaemonCore::serve_connection(std::stop_token stop, int fd) {
    log(std::format("connection {} opened", fd));
    FrameReader reader(max_message_bytes_);

    while (true) {
        std::string frame;
        auto status = reader.next(frame);

        if (status == FrameReader::Status::TooLarge) {
            auto resp = Response::failure(std::nullopt,
                {ErrorKind::MessageTooLarge,
                 std::format("message exceeds {} bytes", max_message_bytes_)});
            if (!ipc_.send_frame(fd, encode_frame(resp))) {
                log(std::format("connection {}: could not deliver error", fd));
            }
            log(std::format("connection {}: message too large, closing", fd));
            break;
        }

        if (status == FrameReader::Status::Frame) {
            bool close_after = false;
            auto resp = dispatcher_.handle_frame(frame, close_after);
            if (!ipc_.send_frame(fd, encode_frame(resp))) break;
            if (close_after) break;
            continue;
        }

        // Idle between requests: a stop request ends the connection here.
        if (stop.stop_requested() && reader.empty()) break;

        if (ipc_.read_some(fd, reader, POLL_TICK_MS) == ReadStatus::Closed) break;
    }

    log(std::format("connection {} closed", fd));
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[fgp-vercel] {}", msg);
    }
}
