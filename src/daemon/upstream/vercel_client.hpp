#pragma once

#include "http_transport.hpp"
#include "upstream_api.hpp"

#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Read the API token from the environment. Absent or empty is an error.
std::expected<std::string, std::string> read_token(const std::string& env_name);

class VercelClient : public UpstreamApi {
public:
    struct Options {
        std::string team_id;
        std::chrono::milliseconds recheck_interval{std::chrono::seconds(30)};
    };

    VercelClient(std::unique_ptr<HttpTransport> transport, Options opts, bool verbose = false);
    ~VercelClient() override;

    VercelClient(const VercelClient&) = delete;
    VercelClient& operator=(const VercelClient&) = delete;

    ApiResult list_projects(int limit) override;
    ApiResult get_project(const std::string& project_id) override;
    ApiResult list_deployments(const std::string& project_id, int limit) override;
    ApiResult get_deployment(const std::string& deployment_id) override;
    ApiResult get_logs(const std::string& deployment_id, int limit) override;
    ApiResult list_domains(const std::string& project_id) override;
    ApiResult get_user() override;

    bool health_check() override;
    UpstreamHealth health() const override;
    void cancel_inflight() override;

    // Build "path?query" with percent-encoded values and the team scope appended.
    std::string target(const std::string& path,
                       const std::map<std::string, std::string>& query = {}) const;

    static std::string url_encode(const std::string& s);

private:
    // GET with the reconnect policy applied; returns the parsed 2xx body.
    ApiResult fetch(const std::string& target);

    bool admit();
    void set_health(UpstreamHealth next);
    void mark_failed();

    void log(const std::string& msg);

    std::unique_ptr<HttpTransport> transport_;
    Options opts_;
    bool verbose_;

    mutable std::mutex health_mu_;
    UpstreamHealth health_ = UpstreamHealth::Connected;
    std::chrono::steady_clock::time_point failed_at_;
};
