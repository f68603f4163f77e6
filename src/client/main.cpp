#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <random>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--socket PATH] <method> [key=value ...]", prog);
    std::println(stderr, "Methods:");
    std::println(stderr, "  list_projects [limit=N]");
    std::println(stderr, "  get_project project_id=ID");
    std::println(stderr, "  list_deployments project_id=ID [limit=N]");
    std::println(stderr, "  get_deployment deployment_id=ID");
    std::println(stderr, "  get_logs deployment_id=ID [limit=N]");
    std::println(stderr, "  get_user");
    std::println(stderr, "  health");
}

static std::string request_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return std::format("{:016x}", gen());
}

// "limit=5" sends a number, anything else a string.
static json param_value(const std::string& raw) {
    long long n = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), n);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) return n;
    return raw;
}

int main(int argc, char* argv[]) {
    std::string sock_path = platform::ipc_endpoint();
    std::string method;
    json params = json::object();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--socket" || arg == "-s") && i + 1 < argc) {
            sock_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (method.empty()) {
            method = arg;
        } else if (auto eq = arg.find('='); eq != std::string::npos) {
            params[arg.substr(0, eq)] = param_value(arg.substr(eq + 1));
        } else {
            std::println(stderr, "Bad parameter (expected key=value): {}", arg);
            return 1;
        }
    }

    if (method.empty()) {
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is fgp-vercel running?");
        return 1;
    }

    json request = {{"id", request_id()}, {"v", 1}, {"method", method}, {"params", params}};
    if (!client.send(request)) {
        std::println(stderr, "Failed to send request");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("ok", false)) {
        std::println("{}", response["result"].dump(2));
        return 0;
    }

    const auto& err = response.contains("error") ? response["error"] : json::object();
    std::println(stderr, "Error [{}]: {}", err.value("kind", "Internal"),
                 err.value("message", "unknown error"));
    return 1;
}
