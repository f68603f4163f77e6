#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Upstream {
        std::string base_url = "https://api.vercel.com";
        std::string token_env = "VERCEL_TOKEN";
        std::string team_id;
        uint32_t pool_size = 4;
        uint32_t timeout_seconds = 30;
        uint32_t connect_timeout_seconds = 10;
        // How long a Failed upstream fails fast before the next call probes it again.
        uint32_t recheck_seconds = 30;
    } upstream;

    struct Server {
        std::string socket_path; // empty: platform::ipc_endpoint()
        size_t max_message_bytes = 1024 * 1024;
        uint32_t shutdown_grace_ms = 5000;
        // Connections beyond this are answered with an error and closed.
        uint32_t max_connections = 64;
    } server;

    static Config load(const std::string& path);
    static Config load_default();
};
