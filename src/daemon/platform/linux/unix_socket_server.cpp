#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool fill_address(const std::string& path, sockaddr_un& addr) {
    addr = {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

StartError bind_error(std::string message) {
    return StartError{StartError::Kind::BindFailed, std::move(message)};
}

} // namespace

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::probe(const std::string& path) {
    sockaddr_un addr;
    if (!fill_address(path, addr)) return false;

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    bool live = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return live;
}

std::expected<void, StartError> UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr;
    if (!fill_address(endpoint, addr)) {
        return std::unexpected(bind_error("socket path too long: " + endpoint));
    }

    auto parent = fs::path(endpoint).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        if (!fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return std::unexpected(bind_error("cannot create " + parent.string() + ": " + ec.message()));
            }
            fs::permissions(parent, fs::perms::owner_all, fs::perm_options::replace, ec);
        }
    }

    // A daemon already answering on this path wins; a dead socket file is stale.
    if (probe(endpoint)) {
        return std::unexpected(StartError{StartError::Kind::AlreadyRunning,
                                          "another instance is listening on " + endpoint});
    }
    std::error_code ec;
    if (fs::is_socket(endpoint, ec)) {
        ::unlink(endpoint.c_str());
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return std::unexpected(bind_error(std::string("socket() failed: ") + std::strerror(errno)));
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = bind_error(std::string("bind() failed: ") + std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return std::unexpected(std::move(err));
    }
    socket_path_ = endpoint;
    ::chmod(endpoint.c_str(), 0600);

    if (::listen(server_fd_, SOMAXCONN) < 0) {
        auto err = bind_error(std::string("listen() failed: ") + std::strerror(errno));
        stop();
        return std::unexpected(std::move(err));
    }

    return {};
}

void UnixSocketServer::stop_accepting() {
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

void UnixSocketServer::stop() {
    stop_accepting();

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    if (server_fd_ < 0) return -1;
    // Client sockets stay blocking; read_some() polls before every recv.
    return ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
}

ReadStatus UnixSocketServer::read_some(int client_fd, FrameReader& reader, int timeout_ms) {
    pollfd pfd{.fd = client_fd, .events = POLLIN, .revents = 0};
    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret == 0) return ReadStatus::Timeout;
    if (ret < 0) return errno == EINTR ? ReadStatus::Timeout : ReadStatus::Closed;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) return ReadStatus::Timeout;
    if (n <= 0) return ReadStatus::Closed;

    reader.feed(std::string_view(buf, static_cast<size_t>(n)));
    return ReadStatus::Data;
}

bool UnixSocketServer::send_frame(int client_fd, std::string_view frame) {
    while (!frame.empty()) {
        ssize_t sent = ::send(client_fd, frame.data(), frame.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        frame.remove_prefix(static_cast<size_t>(sent));
    }
    return true;
}

void UnixSocketServer::interrupt_client(int client_fd) {
    ::shutdown(client_fd, SHUT_RDWR);
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
}
