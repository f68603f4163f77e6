#include "method_registry.hpp"

#include <algorithm>
#include <format>

using json = nlohmann::json;

namespace {

ParamSpec required_string(std::string name) {
    return {.name = std::move(name), .type = ParamType::NonEmptyString, .required = true};
}

ParamSpec optional_string(std::string name) {
    return {.name = std::move(name), .type = ParamType::NonEmptyString, .required = false,
            .default_value = ""};
}

ParamSpec optional_limit(int64_t def, int64_t max) {
    return {.name = "limit", .type = ParamType::BoundedInt, .required = false,
            .default_value = def, .min = 1, .max = max};
}

ApiError invalid(std::string message) {
    return ApiError{.kind = ErrorKind::InvalidParams, .message = std::move(message)};
}

// Wrap an array payload as {<key>: [...], count: N}.
ApiResult listing(ApiResult items, const char* key) {
    if (!items) return items;
    size_t count = items->size();
    return json{{key, std::move(*items)}, {"count", count}};
}

ApiResult wrap(ApiResult value, const char* key) {
    if (!value) return value;
    return json{{key, std::move(*value)}};
}

} // namespace

MethodRegistry MethodRegistry::builtin() {
    MethodRegistry reg;

    auto list_projects = [](DaemonContext& ctx, const json& p) {
        return listing(ctx.upstream.list_projects(p["limit"].get<int>()), "projects");
    };
    auto get_logs = [](DaemonContext& ctx, const json& p) -> ApiResult {
        auto id = p["deployment_id"].get<std::string>();
        auto logs = listing(ctx.upstream.get_logs(id, p["limit"].get<int>()), "logs");
        if (logs) (*logs)["deployment_id"] = id;
        return logs;
    };

    reg.add({"list_projects", {optional_limit(20, 100)}}, list_projects);

    reg.add({"get_project", {required_string("project_id")}},
            [](DaemonContext& ctx, const json& p) {
                return wrap(ctx.upstream.get_project(p["project_id"].get<std::string>()), "project");
            });

    reg.add({"list_deployments", {required_string("project_id"), optional_limit(20, 100)}},
            [](DaemonContext& ctx, const json& p) {
                return listing(ctx.upstream.list_deployments(p["project_id"].get<std::string>(),
                                                             p["limit"].get<int>()),
                               "deployments");
            });

    reg.add({"get_deployment", {required_string("deployment_id")}},
            [](DaemonContext& ctx, const json& p) {
                return wrap(ctx.upstream.get_deployment(p["deployment_id"].get<std::string>()),
                            "deployment");
            });

    reg.add({"get_logs", {required_string("deployment_id"), optional_limit(100, 1000)}}, get_logs);

    reg.add({"list_domains", {required_string("project_id")}},
            [](DaemonContext& ctx, const json& p) {
                return listing(ctx.upstream.list_domains(p["project_id"].get<std::string>()),
                               "domains");
            });

    reg.add({"get_user", {}},
            [](DaemonContext& ctx, const json&) {
                return wrap(ctx.upstream.get_user(), "user");
            });

    reg.add({"health", {}},
            [](DaemonContext& ctx, const json&) -> ApiResult {
                if (ctx.upstream.health() == UpstreamHealth::Failed) {
                    ctx.upstream.health_check();
                }
                auto health = ctx.upstream.health();
                auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::steady_clock::now() - ctx.started_at);
                return json{
                    {"status", health == UpstreamHealth::Connected ? "ok" : "degraded"},
                    {"upstream", std::string(to_string(health))},
                    {"uptime_seconds", uptime.count()},
                    {"version", FGP_VERCEL_VERSION},
                    {"service", "vercel"},
                };
            });

    // Names used by existing fgp callers. `project` takes an id or a name.
    reg.add({"vercel.projects", {optional_limit(20, 100)}}, list_projects);

    reg.add({"vercel.deployments", {optional_string("project"), optional_limit(20, 100)}},
            [](DaemonContext& ctx, const json& p) {
                return listing(ctx.upstream.list_deployments(p["project"].get<std::string>(),
                                                             p["limit"].get<int>()),
                               "deployments");
            });

    reg.add({"vercel.logs", {required_string("deployment_id"), optional_limit(100, 1000)}},
            get_logs);

    // The deployment object itself, not wrapped.
    reg.add({"vercel.status", {required_string("deployment_id")}},
            [](DaemonContext& ctx, const json& p) {
                return ctx.upstream.get_deployment(p["deployment_id"].get<std::string>());
            });

    reg.add({"vercel.domains", {required_string("project")}},
            [](DaemonContext& ctx, const json& p) {
                return listing(ctx.upstream.list_domains(p["project"].get<std::string>()),
                               "domains");
            });

    return reg;
}

void MethodRegistry::add(MethodSpec spec, MethodHandler handler) {
    entries_.push_back({std::move(spec), std::move(handler)});
}

const MethodEntry* MethodRegistry::find(std::string_view name) const {
    auto it = std::ranges::find_if(entries_, [name](const MethodEntry& e) {
        return e.spec.name == name;
    });
    return it != entries_.end() ? &*it : nullptr;
}

std::vector<std::string> MethodRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& e : entries_) out.push_back(e.spec.name);
    return out;
}

ApiResult MethodRegistry::validate(const MethodSpec& spec, const json& params) {
    if (!params.is_object()) {
        return std::unexpected(invalid("params must be an object"));
    }

    // Report a missing required field before complaining about shapes.
    for (const auto& p : spec.params) {
        if (p.required && (!params.contains(p.name) || params[p.name].is_null())) {
            return std::unexpected(invalid("missing " + p.name));
        }
    }

    json out = json::object();
    for (const auto& p : spec.params) {
        if (!params.contains(p.name) || params[p.name].is_null()) {
            out[p.name] = p.default_value;
            continue;
        }

        const json& v = params[p.name];
        switch (p.type) {
            case ParamType::NonEmptyString:
                if (!v.is_string() || v.get_ref<const std::string&>().empty()) {
                    return std::unexpected(invalid(p.name + " must be a non-empty string"));
                }
                break;
            case ParamType::BoundedInt:
                if (!v.is_number_integer() || v.get<int64_t>() < p.min || v.get<int64_t>() > p.max) {
                    return std::unexpected(invalid(
                        std::format("{} must be an integer between {} and {}", p.name, p.min, p.max)));
                }
                break;
        }
        out[p.name] = v;
    }
    return out;
}
