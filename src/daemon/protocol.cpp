#include "protocol.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidParams: return "InvalidParams";
        case ErrorKind::UnknownMethod: return "UnknownMethod";
        case ErrorKind::MalformedRequest: return "MalformedRequest";
        case ErrorKind::MessageTooLarge: return "MessageTooLarge";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::UpstreamUnavailable: return "UpstreamUnavailable";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

Response Response::success(std::string id, json result) {
    return Response{.id = std::move(id), .outcome = std::move(result)};
}

Response Response::failure(std::optional<std::string> id, ApiError error) {
    return Response{.id = std::move(id), .outcome = std::unexpected(std::move(error))};
}

json to_json(const Response& response) {
    json j;
    j["id"] = response.id ? json(*response.id) : json(nullptr);
    j["ok"] = response.ok();
    if (response.ok()) {
        j["result"] = *response.outcome;
    } else {
        const auto& err = response.outcome.error();
        json e = {{"kind", std::string(to_string(err.kind))}, {"message", err.message}};
        if (err.retry_after) e["retry_after"] = *err.retry_after;
        j["error"] = std::move(e);
    }
    return j;
}

std::string encode_frame(const Response& response) {
    // Invalid UTF-8 from upstream payloads is replaced rather than thrown on.
    return to_json(response).dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

namespace {

Response malformed(std::optional<std::string> id, std::string message) {
    return Response::failure(std::move(id), {ErrorKind::MalformedRequest, std::move(message)});
}

bool is_blank(std::string_view s) {
    return std::ranges::all_of(s, [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::expected<Request, Response> decode_request(std::string_view frame) {
    json j = json::parse(frame, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(malformed(std::nullopt, "request is not valid JSON"));
    }
    if (!j.is_object()) {
        return std::unexpected(malformed(std::nullopt, "request must be a JSON object"));
    }

    auto id_it = j.find("id");
    if (id_it == j.end() || !id_it->is_string()) {
        return std::unexpected(malformed(std::nullopt, "missing or non-string id"));
    }

    Request req;
    req.id = id_it->get<std::string>();

    if (auto v = j.find("v"); v != j.end()) {
        if (!v->is_number_integer() || v->get<int64_t>() != PROTOCOL_VERSION) {
            return std::unexpected(malformed(req.id, "unsupported protocol version"));
        }
    }

    auto method_it = j.find("method");
    if (method_it == j.end() || !method_it->is_string()) {
        return std::unexpected(malformed(req.id, "missing or non-string method"));
    }
    req.method = method_it->get<std::string>();

    // Shape of params is checked by the dispatcher; a bad shape is a logical error.
    if (auto p = j.find("params"); p != j.end() && !p->is_null()) {
        req.params = std::move(*p);
    }

    return req;
}

FrameReader::FrameReader(size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

void FrameReader::feed(std::string_view bytes) {
    buf_.append(bytes);
}

FrameReader::Status FrameReader::next(std::string& frame) {
    while (true) {
        auto pos = buf_.find('\n');
        if (pos == std::string::npos) {
            return buf_.size() > max_frame_bytes_ ? Status::TooLarge : Status::NeedMore;
        }
        if (pos > max_frame_bytes_) return Status::TooLarge;

        std::string_view line(buf_.data(), pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (is_blank(line)) {
            buf_.erase(0, pos + 1);
            continue;
        }

        frame.assign(line);
        buf_.erase(0, pos + 1);
        return Status::Frame;
    }
}
