#include <catch2/catch_test_macros.hpp>

#include "dispatcher.hpp"
#include "fake_upstream.hpp"
#include "method_registry.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

json run(Dispatcher& d, const json& request) {
    bool close_after = false;
    auto resp = d.handle_frame(request.dump(), close_after);
    REQUIRE_FALSE(close_after);
    return to_json(resp);
}

} // namespace

TEST_CASE("Dispatcher", "[dispatcher]") {
    FakeUpstream upstream;
    DaemonContext ctx{.upstream = upstream};
    auto registry = MethodRegistry::builtin();
    Dispatcher d(registry, ctx);

    SECTION("ListProjectsScenario") {
        auto r = run(d, {{"id", "1"}, {"v", 1}, {"method", "list_projects"}, {"params", {{"limit", 5}}}});
        REQUIRE(r["id"] == "1");
        REQUIRE(r["ok"] == true);
        REQUIRE(r["result"]["projects"].size() == 5);
        REQUIRE(r["result"]["count"] == 5);
    }

    SECTION("MissingDeploymentIdScenario") {
        auto r = run(d, {{"id", "2"}, {"v", 1}, {"method", "get_deployment"}, {"params", json::object()}});
        REQUIRE(r == json{{"id", "2"}, {"ok", false},
                          {"error", {{"kind", "InvalidParams"}, {"message", "missing deployment_id"}}}});
        REQUIRE(upstream.calls.load() == 0);
    }

    SECTION("AllMethodsSucceedWithRequiredParams") {
        struct Case { const char* method; json params; const char* key; };
        const Case cases[] = {
            {"list_projects", json::object(), "projects"},
            {"get_project", {{"project_id", "prj_1"}}, "project"},
            {"list_deployments", {{"project_id", "prj_1"}}, "deployments"},
            {"get_deployment", {{"deployment_id", "dpl_2"}}, "deployment"},
            {"get_logs", {{"deployment_id", "dpl_1"}}, "logs"},
            {"get_user", json::object(), "user"},
            {"list_domains", {{"project_id", "prj_1"}}, "domains"},
        };
        for (const auto& c : cases) {
            auto r = run(d, {{"id", c.method}, {"v", 1}, {"method", c.method}, {"params", c.params}});
            INFO(c.method);
            REQUIRE(r["id"] == c.method);
            REQUIRE(r["ok"] == true);
            REQUIRE(r["result"].contains(c.key));
        }
    }

    SECTION("ListingCountsMatch") {
        auto r = run(d, {{"id", "a"}, {"method", "list_deployments"},
                         {"params", {{"project_id", "prj_1"}, {"limit", 2}}}});
        REQUIRE(r["result"]["deployments"].size() == 2);
        REQUIRE(r["result"]["count"] == 2);

        auto logs = run(d, {{"id", "b"}, {"method", "get_logs"}, {"params", {{"deployment_id", "dpl_1"}}}});
        REQUIRE(logs["result"]["deployment_id"] == "dpl_1");
        REQUIRE(logs["result"]["count"] == 2);
        REQUIRE(logs["result"]["logs"][1]["level"] == "error");
    }

    SECTION("EachMissingRequiredParam") {
        const std::pair<const char*, const char*> cases[] = {
            {"get_project", "project_id"},
            {"list_deployments", "project_id"},
            {"get_deployment", "deployment_id"},
            {"get_logs", "deployment_id"},
            {"list_domains", "project_id"},
            {"vercel.status", "deployment_id"},
            {"vercel.domains", "project"},
        };
        for (const auto& [method, field] : cases) {
            auto r = run(d, {{"id", "m"}, {"v", 1}, {"method", method}, {"params", {{"limit", 3}}}});
            INFO(method);
            REQUIRE(r["ok"] == false);
            REQUIRE(r["error"]["kind"] == "InvalidParams");
            REQUIRE(r["error"]["message"] == std::string("missing ") + field);
        }
    }

    SECTION("DomainsForProject") {
        auto r = run(d, {{"id", "d"}, {"method", "list_domains"}, {"params", {{"project_id", "prj_1"}}}});
        REQUIRE(r["ok"] == true);
        REQUIRE(r["result"]["count"] == 2);
        REQUIRE(r["result"]["domains"][0]["name"] == "project-1.vercel.app");
        REQUIRE(r["result"]["domains"][1]["verified"] == false);

        auto missing = run(d, {{"id", "d2"}, {"method", "list_domains"},
                               {"params", {{"project_id", "prj_7"}}}});
        REQUIRE(missing["error"]["kind"] == "NotFound");
    }

    SECTION("CallerMethodNames") {
        auto projects = run(d, {{"id", "p"}, {"method", "vercel.projects"}, {"params", json::object()}});
        REQUIRE(projects["ok"] == true);
        REQUIRE(projects["result"]["count"] == 7);

        auto all = run(d, {{"id", "a"}, {"method", "vercel.deployments"}, {"params", {{"limit", 5}}}});
        REQUIRE(all["ok"] == true);
        REQUIRE(all["result"]["deployments"].size() == 3);

        auto by_name = run(d, {{"id", "n"}, {"method", "vercel.deployments"},
                               {"params", {{"project", "project-1"}, {"limit", 2}}}});
        REQUIRE(by_name["result"]["count"] == 2);

        auto logs = run(d, {{"id", "l"}, {"method", "vercel.logs"},
                            {"params", {{"deployment_id", "dpl_1"}, {"limit", 50}}}});
        REQUIRE(logs["result"]["logs"].size() == 2);

        auto status = run(d, {{"id", "s"}, {"method", "vercel.status"},
                              {"params", {{"deployment_id", "dpl_2"}}}});
        REQUIRE(status["ok"] == true);
        REQUIRE(status["result"]["state"] == "READY");
        REQUIRE(status["result"]["uid"] == "dpl_2");

        auto domains = run(d, {{"id", "m"}, {"method", "vercel.domains"},
                               {"params", {{"project", "project-1"}}}});
        REQUIRE(domains["result"]["domains"].size() == 2);
    }

    SECTION("UnknownMethodRegardlessOfParams") {
        for (const json& params : {json::object(), json::array(), json("x"), json(nullptr)}) {
            auto r = run(d, {{"id", "u"}, {"v", 1}, {"method", "delete_everything"}, {"params", params}});
            REQUIRE(r["id"] == "u");
            REQUIRE(r["error"]["kind"] == "UnknownMethod");
        }
    }

    SECTION("NotFoundIsNotInternal") {
        auto r = run(d, {{"id", "n"}, {"method", "get_project"}, {"params", {{"project_id", "prj_missing"}}}});
        REQUIRE(r["ok"] == false);
        REQUIRE(r["error"]["kind"] == "NotFound");
    }

    SECTION("UnauthorizedEverywhere") {
        upstream.unauthorized = true;
        for (const char* method : {"list_projects", "get_user"}) {
            auto r = run(d, {{"id", method}, {"method", method}});
            REQUIRE(r["error"]["kind"] == "Unauthorized");
        }
        auto r = run(d, {{"id", "g"}, {"method", "get_logs"}, {"params", {{"deployment_id", "dpl_1"}}}});
        REQUIRE(r["error"]["kind"] == "Unauthorized");
    }

    SECTION("MalformedFrameClosesConnection") {
        bool close_after = false;
        auto resp = to_json(d.handle_frame("{\"id\": \"zz\", ", close_after));
        REQUIRE(close_after);
        REQUIRE(resp["id"].is_null());
        REQUIRE(resp["error"]["kind"] == "MalformedRequest");
    }

    SECTION("HealthReportsUpstreamState") {
        auto r = run(d, {{"id", "h"}, {"method", "health"}});
        REQUIRE(r["ok"] == true);
        REQUIRE(r["result"]["status"] == "ok");
        REQUIRE(r["result"]["upstream"] == "connected");
        REQUIRE(upstream.health_checks.load() == 0);

        upstream.state = UpstreamHealth::Failed;
        upstream.probe_succeeds = false;
        r = run(d, {{"id", "h2"}, {"method", "health"}});
        REQUIRE(r["result"]["status"] == "degraded");
        REQUIRE(r["result"]["upstream"] == "failed");
        REQUIRE(upstream.health_checks.load() == 1);

        upstream.probe_succeeds = true;
        r = run(d, {{"id", "h3"}, {"method", "health"}});
        REQUIRE(r["result"]["upstream"] == "connected");
    }

    SECTION("HandlerExceptionBecomesInternal") {
        MethodRegistry reg;
        reg.add({"explode", {}}, [](DaemonContext&, const json&) -> ApiResult {
            throw std::runtime_error("secret detail");
        });
        Dispatcher local(reg, ctx);
        auto r = run(local, {{"id", "x"}, {"method", "explode"}});
        REQUIRE(r["id"] == "x");
        REQUIRE(r["error"]["kind"] == "Internal");
        REQUIRE(r["error"]["message"] == "internal error");
    }
}
