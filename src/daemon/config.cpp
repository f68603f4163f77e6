#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Integer setting clamped to [min, max]. A non-number throws json::type_error,
// which falls back to the defaults like any other parse error.
template <typename T>
void read_bounded(const json& obj, const char* key, T& out, int64_t min, int64_t max) {
    if (!obj.contains(key)) return;
    int64_t n = obj[key].get<int64_t>();
    if (n < min || n > max) {
        int64_t clamped = std::clamp(n, min, max);
        std::println(stderr, "config: {} = {} out of range [{}, {}], using {}", key, n, min, max,
                     clamped);
        n = clamped;
    }
    out = static_cast<T>(n);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("upstream")) {
            auto& u = j["upstream"];
            if (u.contains("base_url")) cfg.upstream.base_url = u["base_url"].get<std::string>();
            if (u.contains("token_env")) cfg.upstream.token_env = u["token_env"].get<std::string>();
            if (u.contains("team_id")) cfg.upstream.team_id = u["team_id"].get<std::string>();
            read_bounded(u, "pool_size", cfg.upstream.pool_size, 1, 64);
            read_bounded(u, "timeout_seconds", cfg.upstream.timeout_seconds, 1, 3600);
            read_bounded(u, "connect_timeout_seconds", cfg.upstream.connect_timeout_seconds, 1, 600);
            read_bounded(u, "recheck_seconds", cfg.upstream.recheck_seconds, 0, 86400);
        }

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("socket_path")) cfg.server.socket_path = s["socket_path"].get<std::string>();
            read_bounded(s, "max_message_bytes", cfg.server.max_message_bytes, 1024,
                         64 * 1024 * 1024);
            read_bounded(s, "shutdown_grace_ms", cfg.server.shutdown_grace_ms, 0, 600000);
            read_bounded(s, "max_connections", cfg.server.max_connections, 1, 4096);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
