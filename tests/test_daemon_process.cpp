#include <catch2/catch_test_macros.hpp>

#include "fake_upstream.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/unix_socket_client.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/resource.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

// These tests fork: the child never returns into the test runner, it always
// leaves through _exit().

namespace {

std::string tmp_socket_path(const std::string& tag) {
    return "/tmp/fgp_vercel_proc_" + tag + "_" + std::to_string(getpid()) + ".sock";
}

bool wait_until(const std::function<bool()>& cond, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return cond();
}

Config quick_config(const std::string& path) {
    Config cfg;
    cfg.server.socket_path = path;
    cfg.server.shutdown_grace_ms = 100;
    return cfg;
}

} // namespace

TEST_CASE("Daemon process", "[process]") {

    SECTION("StopsOnSigtermAfterDaemonizing") {
        auto path = tmp_socket_path("sigterm");
        int pid_pipe[2];
        REQUIRE(::pipe(pid_pipe) == 0);

        pid_t child = ::fork();
        REQUIRE(child >= 0);
        if (child == 0) {
            ::close(pid_pipe[0]);
            // Same order as main(): bind first, then detach, then serve.
            LinuxEventLoop loop(quick_config(path), false, std::make_unique<FakeUpstream>());
            if (!loop.init()) _exit(10);
            platform::daemonize();
            pid_t self = ::getpid();
            if (::write(pid_pipe[1], &self, sizeof(self)) != sizeof(self)) _exit(12);
            ::close(pid_pipe[1]);
            _exit(loop.run() ? 0 : 11);
        }

        ::close(pid_pipe[1]);
        int status = 0;
        REQUIRE(::waitpid(child, &status, 0) == child);
        REQUIRE(WIFEXITED(status));
        REQUIRE(WEXITSTATUS(status) == 0);

        pid_t daemon_pid = 0;
        REQUIRE(::read(pid_pipe[0], &daemon_pid, sizeof(daemon_pid)) == sizeof(daemon_pid));
        ::close(pid_pipe[0]);

        {
            UnixSocketClient client;
            REQUIRE(client.connect(path));
            REQUIRE(client.send({{"id", "h"}, {"v", 1}, {"method", "health"}}));
            nlohmann::json resp;
            REQUIRE(client.recv(resp, 2000));
            REQUIRE(resp["ok"] == true);
        }

        REQUIRE(::kill(daemon_pid, SIGTERM) == 0);
        bool cleaned_up = wait_until([&] { return !std::filesystem::exists(path); },
                                     std::chrono::seconds(3));
        if (!cleaned_up) {
            ::kill(daemon_pid, SIGKILL);
            std::filesystem::remove(path);
        }
        REQUIRE(cleaned_up);
    }

    SECTION("AcceptBacksOffWhenOutOfDescriptors") {
        auto path = tmp_socket_path("emfile");

        pid_t child = ::fork();
        REQUIRE(child >= 0);
        if (child == 0) {
            LinuxEventLoop loop(quick_config(path), false, std::make_unique<FakeUpstream>());
            if (!loop.init()) _exit(10);

            // Leave room for exactly the epoll and signal descriptors run()
            // creates; every accept after that fails with EMFILE.
            int a = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            int b = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (a < 0 || b < 0) _exit(12);
            int top = std::max(a, b);
            ::close(a);
            ::close(b);

            rlimit lim{};
            if (::getrlimit(RLIMIT_NOFILE, &lim) != 0) _exit(13);
            lim.rlim_cur = static_cast<rlim_t>(top + 1);
            if (::setrlimit(RLIMIT_NOFILE, &lim) != 0) _exit(13);

            _exit(loop.run() ? 0 : 11);
        }

        REQUIRE(wait_until([&] { return std::filesystem::exists(path); }, std::chrono::seconds(2)));
        UnixSocketClient client;
        REQUIRE(client.connect(path)); // queued in the backlog, never accepted
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));

        REQUIRE(::kill(child, SIGTERM) == 0);
        int status = 0;
        rusage usage{};
        REQUIRE(::wait4(child, &status, 0, &usage) == child);
        REQUIRE(WIFEXITED(status));
        REQUIRE(WEXITSTATUS(status) == 0);
        REQUIRE_FALSE(std::filesystem::exists(path));

        auto cpu_ms = (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000 +
                      (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000;
        // A busy loop on the readable listener would burn the whole interval.
        REQUIRE(cpu_ms < 500);
    }
}
