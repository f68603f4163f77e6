#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

enum class UpstreamHealth { Connected, Reconnecting, Failed };

std::string_view to_string(UpstreamHealth health);

// Typed operations against the remote platform API. Every call returns a
// normalized payload or an ApiError already mapped to the local taxonomy.
// Implementations must be safe to call from many connection threads at once.
class UpstreamApi {
public:
    virtual ~UpstreamApi() = default;

    // Array of project objects, at most `limit` long.
    virtual ApiResult list_projects(int limit) = 0;
    virtual ApiResult get_project(const std::string& project_id) = 0;
    // Array of deployment objects, at most `limit` long. An empty project_id
    // lists deployments across the whole account.
    virtual ApiResult list_deployments(const std::string& project_id, int limit) = 0;
    virtual ApiResult get_deployment(const std::string& deployment_id) = 0;
    // Array of {created, type, level, message} entries.
    virtual ApiResult get_logs(const std::string& deployment_id, int limit) = 0;
    // Array of domain objects ({name, verified, ...}) attached to a project.
    virtual ApiResult list_domains(const std::string& project_id) = 0;
    virtual ApiResult get_user() = 0;

    // Probe the remote API on a fresh connection. Restores Connected on success.
    virtual bool health_check() = 0;
    virtual UpstreamHealth health() const = 0;

    // Abort transfers currently in flight. Used when shutdown runs out of grace.
    virtual void cancel_inflight() = 0;
};
