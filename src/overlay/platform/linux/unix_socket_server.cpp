#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <string_view>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

std::string errno_message(const char* call) {
    return std::string(call) + " failed: " + std::strerror(errno);
}

} // namespace

UnixSocketServer::~UnixSocketServer() {
    shutdown();
}

std::expected<void, std::string> UnixSocketServer::listen(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        return std::unexpected("control socket path too long: " + endpoint);
    }
    std::memcpy(addr.sun_path, endpoint.c_str(), endpoint.size() + 1);
    auto* sa = reinterpret_cast<sockaddr*>(&addr);

    // Connecting succeeds only if an overlay is still serving the path.
    int probe = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (probe >= 0) {
        bool live = ::connect(probe, sa, sizeof(addr)) == 0;
        ::close(probe);
        if (live) {
            return std::unexpected("livecap is already running (" + endpoint + ")");
        }
    }
    ::unlink(endpoint.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::unexpected(errno_message("socket()"));

    // Other users must not drive the overlay.
    mode_t old_mask = ::umask(0077);
    int bound = ::bind(fd, sa, sizeof(addr));
    ::umask(old_mask);

    if (bound < 0) {
        auto err = errno_message("bind()");
        ::close(fd);
        return std::unexpected(err);
    }
    if (::listen(fd, 4) < 0) {
        auto err = errno_message("listen()");
        ::close(fd);
        ::unlink(endpoint.c_str());
        return std::unexpected(err);
    }

    listen_fd_ = fd;
    socket_path_ = endpoint;
    return {};
}

void UnixSocketServer::shutdown() {
    for (auto& c : clients_) ::close(c.fd);
    clients_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    if (clients_.size() >= kMaxClients) {
        std::println(stderr, "control: too many clients, refusing connection");
        ::close(fd);
        return -1;
    }
    clients_.push_back({fd, {}});
    return fd;
}

bool UnixSocketServer::read_requests(int client_fd, std::vector<nlohmann::json>& requests) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n == 0) return false;
    if (n < 0) return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;

    client->pending.append(buf, static_cast<size_t>(n));

    size_t start = 0;
    for (size_t nl; (nl = client->pending.find('\n', start)) != std::string::npos; start = nl + 1) {
        std::string_view line(client->pending.data() + start, nl - start);
        if (line.empty()) continue;
        requests.push_back(nlohmann::json::parse(line, nullptr, false));
    }
    client->pending.erase(0, start);

    if (client->pending.size() > kMaxLineBytes) {
        std::println(stderr, "control: dropping client {} (request too long)", client_fd);
        return false;
    }
    return true;
}

bool UnixSocketServer::reply(int client_fd, const nlohmann::json& response) {
    std::string line = response.dump() + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t sent = ::send(client_fd, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (sent >= 0) {
            off += static_cast<size_t>(sent);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return false;

        // Slow reader: give it a second before giving up on the reply.
        pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
        if (::poll(&pfd, 1, 1000) <= 0) return false;
    }
    return true;
}

void UnixSocketServer::drop_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const Client& c) { return c.fd == client_fd; });
}

UnixSocketServer::Client* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
