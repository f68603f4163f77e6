#pragma once

#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// Local protocol: newline-delimited JSON. Every request and every response is
// one JSON object on a single line terminated by '\n'. A connection may carry
// any number of sequential requests; responses are written in request order.

inline constexpr int PROTOCOL_VERSION = 1;

enum class ErrorKind {
    InvalidParams,
    UnknownMethod,
    MalformedRequest,
    MessageTooLarge,
    Unauthorized,
    NotFound,
    RateLimited,
    UpstreamUnavailable,
    Internal,
};

std::string_view to_string(ErrorKind kind);

struct ApiError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::optional<long> retry_after; // seconds, RateLimited only
};

using ApiResult = std::expected<nlohmann::json, ApiError>;

struct Request {
    std::string id;
    int version = PROTOCOL_VERSION;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Response {
    std::optional<std::string> id; // nullopt if the request id could not be recovered
    ApiResult outcome;

    bool ok() const { return outcome.has_value(); }

    static Response success(std::string id, nlohmann::json result);
    static Response failure(std::optional<std::string> id, ApiError error);
};

nlohmann::json to_json(const Response& response);

// Serialize a response as one frame, including the trailing newline.
std::string encode_frame(const Response& response);

// Parse one frame into a Request. On failure the returned Response is the
// MalformedRequest reply, carrying the id when it could be recovered.
std::expected<Request, Response> decode_request(std::string_view frame);

// Accumulates bytes from one connection and splits them into frames.
class FrameReader {
public:
    enum class Status { Frame, NeedMore, TooLarge };

    explicit FrameReader(size_t max_frame_bytes);

    void feed(std::string_view bytes);

    // Extract the next non-blank frame (without its newline) into `frame`.
    Status next(std::string& frame);

    bool empty() const { return buf_.empty(); }
    size_t buffered() const { return buf_.size(); }

private:
    size_t max_frame_bytes_;
    std::string buf_;
};
