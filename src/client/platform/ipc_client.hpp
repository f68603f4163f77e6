#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    // Send one request frame (JSON plus newline).
    virtual bool send(const nlohmann::json& request) = 0;
    // Send bytes as-is, without framing.
    virtual bool send_raw(std::string_view bytes) = 0;
    // Read the next response frame. False on timeout, EOF or unparseable frame.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
