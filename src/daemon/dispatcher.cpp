#include "dispatcher.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <print>

Dispatcher::Dispatcher(const MethodRegistry& registry, DaemonContext& ctx, bool verbose)
    : registry_(registry), ctx_(ctx), verbose_(verbose) {}

Response Dispatcher::handle_frame(std::string_view frame, bool& close_after) {
    auto req = decode_request(frame);
    if (!req) {
        close_after = true;
        log("malformed request: " + req.error().outcome.error().message);
        return std::move(req.error());
    }
    close_after = false;
    return dispatch(*req);
}

Response Dispatcher::dispatch(const Request& req) {
    auto start = std::chrono::steady_clock::now();

    const MethodEntry* entry = registry_.find(req.method);
    if (!entry) {
        log("unknown method: " + req.method);
        return Response::failure(req.id, {ErrorKind::UnknownMethod, "unknown method: " + req.method});
    }

    auto params = MethodRegistry::validate(entry->spec, req.params);
    if (!params) {
        log(std::format("{} rejected: {}", req.method, params.error().message));
        return Response::failure(req.id, std::move(params.error()));
    }

    ApiResult result;
    try {
        result = entry->handler(ctx_, *params);
    } catch (const std::exception& e) {
        std::println(stderr, "[fgp-vercel] {} failed internally: {}", req.method, e.what());
        result = std::unexpected(ApiError{ErrorKind::Internal, "internal error"});
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log(std::format("{} -> {} ({}ms)", req.method,
                    result ? std::string_view("ok") : to_string(result.error().kind),
                    elapsed.count()));

    if (!result) return Response::failure(req.id, std::move(result.error()));
    return Response::success(req.id, std::move(*result));
}

void Dispatcher::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[fgp-vercel] {}", msg);
    }
}
