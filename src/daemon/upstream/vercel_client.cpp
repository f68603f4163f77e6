#include "vercel_client.hpp"

#include <cctype>
#include <cstdlib>
#include <format>
#include <print>

using json = nlohmann::json;

std::string_view to_string(UpstreamHealth health) {
    switch (health) {
        case UpstreamHealth::Connected: return "connected";
        case UpstreamHealth::Reconnecting: return "reconnecting";
        case UpstreamHealth::Failed: return "failed";
    }
    return "failed";
}

std::expected<std::string, std::string> read_token(const std::string& env_name) {
    const char* value = std::getenv(env_name.c_str());
    if (!value || !*value) {
        return std::unexpected(env_name + " is not set");
    }
    return std::string(value);
}

namespace {

ApiError upstream_error(ErrorKind kind, std::string message) {
    return ApiError{.kind = kind, .message = std::move(message), .retry_after = std::nullopt};
}

// Vercel wraps failures as {"error": {"code": ..., "message": ...}}.
std::string error_message(const std::string& body, const std::string& fallback) {
    json j = json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("error") && j["error"].is_object()) {
        auto& e = j["error"];
        if (e.contains("message") && e["message"].is_string()) {
            return e["message"].get<std::string>();
        }
    }
    return fallback;
}

ApiResult map_response(const HttpResponse& resp) {
    long s = resp.status;

    if (s >= 200 && s < 300) {
        json j = json::parse(resp.body, nullptr, false);
        if (j.is_discarded()) {
            std::println(stderr, "[fgp-vercel] upstream returned non-JSON body (status {})", s);
            return std::unexpected(upstream_error(ErrorKind::Internal, "internal error"));
        }
        return j;
    }

    if (s == 401 || s == 403) {
        return std::unexpected(upstream_error(ErrorKind::Unauthorized,
            error_message(resp.body, "upstream rejected the credential")));
    }
    if (s == 404) {
        return std::unexpected(upstream_error(ErrorKind::NotFound,
            error_message(resp.body, "not found")));
    }
    if (s == 429) {
        std::string msg = "rate limited by upstream";
        if (resp.retry_after) msg += std::format("; retry after {} seconds", *resp.retry_after);
        return std::unexpected(ApiError{ErrorKind::RateLimited, std::move(msg), resp.retry_after});
    }
    if (s == 400 || s == 422) {
        return std::unexpected(upstream_error(ErrorKind::InvalidParams,
            error_message(resp.body, "upstream rejected the request parameters")));
    }
    if (s >= 500) {
        return std::unexpected(upstream_error(ErrorKind::UpstreamUnavailable,
            std::format("upstream error (HTTP {})", s)));
    }

    std::println(stderr, "[fgp-vercel] unexpected upstream status {}", s);
    return std::unexpected(upstream_error(ErrorKind::Internal, "internal error"));
}

ApiError shape_error(const char* what) {
    std::println(stderr, "[fgp-vercel] unexpected upstream response shape: {}", what);
    return upstream_error(ErrorKind::Internal, "internal error");
}

json take(json items, int limit) {
    if (limit >= 0 && items.size() > static_cast<size_t>(limit)) {
        items.erase(items.begin() + limit, items.end());
    }
    return items;
}

std::string log_level(const std::string& type) {
    if (type == "stderr" || type == "error" || type == "fatal") return "error";
    if (type == "warning") return "warn";
    return "info";
}

json normalize_event(const json& ev) {
    std::string type = ev.value("type", "");
    std::string message;
    if (ev.contains("payload") && ev["payload"].is_object() &&
        ev["payload"].contains("text") && ev["payload"]["text"].is_string()) {
        message = ev["payload"]["text"].get<std::string>();
    } else if (ev.contains("text") && ev["text"].is_string()) {
        message = ev["text"].get<std::string>();
    }

    json created = nullptr;
    if (ev.contains("created")) created = ev["created"];
    else if (ev.contains("payload") && ev["payload"].is_object() && ev["payload"].contains("created"))
        created = ev["payload"]["created"];

    return {
        {"created", created},
        {"type", type},
        {"level", log_level(type)},
        {"message", std::move(message)},
    };
}

} // namespace

VercelClient::VercelClient(std::unique_ptr<HttpTransport> transport, Options opts, bool verbose)
    : transport_(std::move(transport)), opts_(std::move(opts)), verbose_(verbose) {}

VercelClient::~VercelClient() = default;

std::string VercelClient::url_encode(const std::string& s) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string VercelClient::target(const std::string& path,
                                 const std::map<std::string, std::string>& query) const {
    std::string out = path;
    char sep = '?';
    for (const auto& [key, value] : query) {
        out += sep + key + "=" + url_encode(value);
        sep = '&';
    }
    if (!opts_.team_id.empty()) {
        out += sep + std::string("teamId=") + url_encode(opts_.team_id);
    }
    return out;
}

ApiResult VercelClient::list_projects(int limit) {
    auto body = fetch(target("/v9/projects", {{"limit", std::to_string(limit)}}));
    if (!body) return body;
    if (!body->contains("projects") || !(*body)["projects"].is_array()) {
        return std::unexpected(shape_error("projects"));
    }
    return take(std::move((*body)["projects"]), limit);
}

ApiResult VercelClient::get_project(const std::string& project_id) {
    return fetch(target("/v9/projects/" + url_encode(project_id)));
}

ApiResult VercelClient::list_deployments(const std::string& project_id, int limit) {
    std::map<std::string, std::string> query{{"limit", std::to_string(limit)}};
    if (!project_id.empty()) query["projectId"] = project_id;
    auto body = fetch(target("/v6/deployments", query));
    if (!body) return body;
    if (!body->contains("deployments") || !(*body)["deployments"].is_array()) {
        return std::unexpected(shape_error("deployments"));
    }
    return take(std::move((*body)["deployments"]), limit);
}

ApiResult VercelClient::get_deployment(const std::string& deployment_id) {
    return fetch(target("/v13/deployments/" + url_encode(deployment_id)));
}

ApiResult VercelClient::get_logs(const std::string& deployment_id, int limit) {
    auto body = fetch(target("/v3/deployments/" + url_encode(deployment_id) + "/events",
                             {{"limit", std::to_string(limit)}}));
    if (!body) return body;

    const json* events = nullptr;
    if (body->is_array()) {
        events = &*body;
    } else if (body->contains("events") && (*body)["events"].is_array()) {
        events = &(*body)["events"];
    } else {
        return std::unexpected(shape_error("events"));
    }

    json logs = json::array();
    for (const auto& ev : *events) {
        if (!ev.is_object()) continue;
        logs.push_back(normalize_event(ev));
    }
    return take(std::move(logs), limit);
}

ApiResult VercelClient::list_domains(const std::string& project_id) {
    auto body = fetch(target("/v9/projects/" + url_encode(project_id) + "/domains"));
    if (!body) return body;
    if (!body->contains("domains") || !(*body)["domains"].is_array()) {
        return std::unexpected(shape_error("domains"));
    }
    return std::move((*body)["domains"]);
}

ApiResult VercelClient::get_user() {
    auto body = fetch(target("/v2/user"));
    if (!body) return body;
    if (body->contains("user") && (*body)["user"].is_object()) {
        return std::move((*body)["user"]);
    }
    return body;
}

ApiResult VercelClient::fetch(const std::string& target) {
    if (!admit()) {
        return std::unexpected(upstream_error(ErrorKind::UpstreamUnavailable,
            "upstream unavailable; waiting for a successful health check"));
    }

    auto resp = transport_->get(target, false);
    if (!resp) {
        log("upstream transport failure: " + resp.error() + "; reconnecting");
        set_health(UpstreamHealth::Reconnecting);
        resp = transport_->get(target, true);
        if (!resp) {
            mark_failed();
            return std::unexpected(upstream_error(ErrorKind::UpstreamUnavailable,
                "upstream unreachable: " + resp.error()));
        }
    }

    set_health(UpstreamHealth::Connected);
    return map_response(*resp);
}

bool VercelClient::health_check() {
    // Any HTTP answer, even 401, proves the remote API is reachable.
    auto resp = transport_->get(target("/v2/user"), true);
    if (!resp) {
        log("health check failed: " + resp.error());
        mark_failed();
        return false;
    }
    set_health(UpstreamHealth::Connected);
    return true;
}

UpstreamHealth VercelClient::health() const {
    std::lock_guard lock(health_mu_);
    return health_;
}

void VercelClient::cancel_inflight() {
    transport_->cancel_inflight();
}

bool VercelClient::admit() {
    std::lock_guard lock(health_mu_);
    if (health_ != UpstreamHealth::Failed) return true;
    // Once the recheck interval has passed, this call doubles as the health
    // probe. Restarting the interval keeps concurrent callers failing fast.
    auto now = std::chrono::steady_clock::now();
    if (now - failed_at_ < opts_.recheck_interval) return false;
    failed_at_ = now;
    return true;
}

void VercelClient::set_health(UpstreamHealth next) {
    UpstreamHealth prev;
    {
        std::lock_guard lock(health_mu_);
        prev = health_;
        health_ = next;
    }
    if (prev != next) {
        log(std::format("upstream {} -> {}", to_string(prev), to_string(next)));
    }
}

void VercelClient::mark_failed() {
    {
        std::lock_guard lock(health_mu_);
        failed_at_ = std::chrono::steady_clock::now();
    }
    set_health(UpstreamHealth::Failed);
}

void VercelClient::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[fgp-vercel] {}", msg);
    }
}
