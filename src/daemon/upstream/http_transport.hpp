#pragma once

#include <expected>
#include <optional>
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
    std::optional<long> retry_after; // seconds, from a Retry-After header
};

// Authenticated GET against the remote API. An unexpected() result means the
// request never produced an HTTP response (DNS, connect, TLS, reset, timeout).
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // `target` is the path plus query, e.g. "/v9/projects?limit=5".
    // `fresh_connection` bypasses any kept-alive connection.
    virtual std::expected<HttpResponse, std::string>
        get(const std::string& target, bool fresh_connection) = 0;

    virtual void cancel_inflight() = 0;
};
