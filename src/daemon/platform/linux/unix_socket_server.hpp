#pragma once

#include "platform/ipc_server.hpp"

#include <string>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    std::expected<void, StartError> start(const std::string& endpoint) override;
    void stop_accepting() override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadStatus read_some(int client_fd, FrameReader& reader, int timeout_ms) override;
    bool send_frame(int client_fd, std::string_view frame) override;
    void interrupt_client(int client_fd) override;
    void close_client(int client_fd) override;

    // True if something is accepting connections at `path`.
    static bool probe(const std::string& path);

private:
    int server_fd_ = -1;
    std::string socket_path_;
};
