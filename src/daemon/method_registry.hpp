#pragma once

#include "daemon_context.hpp"
#include "protocol.hpp"

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

enum class ParamType { NonEmptyString, BoundedInt };

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::NonEmptyString;
    bool required = true;
    nlohmann::json default_value; // used when !required and the param is absent
    int64_t min = 0;              // BoundedInt only
    int64_t max = 0;
};

struct MethodSpec {
    std::string name;
    std::vector<ParamSpec> params;
};

// Handlers receive params already validated and filled with defaults.
using MethodHandler = std::function<ApiResult(DaemonContext&, const nlohmann::json& params)>;

struct MethodEntry {
    MethodSpec spec;
    MethodHandler handler;
};

class MethodRegistry {
public:
    // The fixed method set served by the daemon.
    static MethodRegistry builtin();

    void add(MethodSpec spec, MethodHandler handler);

    const MethodEntry* find(std::string_view name) const;

    std::vector<std::string> names() const;

    // Check `params` against the spec. Unknown keys are dropped; missing
    // optional keys take their defaults.
    static ApiResult validate(const MethodSpec& spec, const nlohmann::json& params);

private:
    std::vector<MethodEntry> entries_;
};
