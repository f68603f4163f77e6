#pragma once

#include "protocol.hpp"

#include <expected>
#include <string>
#include <string_view>

struct StartError {
    enum class Kind { AlreadyRunning, BindFailed, System };
    Kind kind = Kind::System;
    std::string message;
};

enum class ReadStatus { Data, Timeout, Closed };

class IpcServer {
public:
    virtual ~IpcServer() = default;

    virtual std::expected<void, StartError> start(const std::string& endpoint) = 0;
    // Close the listening endpoint; established connections are unaffected.
    virtual void stop_accepting() = 0;
    // stop_accepting() and remove the endpoint.
    virtual void stop() = 0;

    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;

    // Wait up to timeout_ms for bytes and feed them to `reader`.
    virtual ReadStatus read_some(int client_fd, FrameReader& reader, int timeout_ms) = 0;
    virtual bool send_frame(int client_fd, std::string_view frame) = 0;

    // Wake any thread blocked on this client and make further I/O fail.
    virtual void interrupt_client(int client_fd) = 0;
    virtual void close_client(int client_fd) = 0;
};
