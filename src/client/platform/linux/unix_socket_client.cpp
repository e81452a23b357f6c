#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

std::expected<void, std::string> UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        return std::unexpected("control socket path too long: " + endpoint);
    }
    std::memcpy(addr.sun_path, endpoint.c_str(), endpoint.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(std::string("socket() failed: ") + std::strerror(errno));
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        if (err == ENOENT || err == ECONNREFUSED) {
            return std::unexpected("livecap is not running (no overlay at " + endpoint + ")");
        }
        return std::unexpected("cannot connect to " + endpoint + ": " + std::strerror(err));
    }

    fd_ = fd;
    return {};
}

std::expected<nlohmann::json, std::string>
UnixSocketClient::request(const nlohmann::json& req, int timeout_ms) {
    if (auto sent = write_line(req); !sent) return std::unexpected(sent.error());
    return read_line(timeout_ms);
}

std::expected<void, std::string> UnixSocketClient::write_line(const nlohmann::json& msg) {
    if (fd_ < 0) return std::unexpected("not connected");

    std::string line = msg.dump() + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::send(fd_, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("send failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return {};
}

std::expected<nlohmann::json, std::string> UnixSocketClient::read_line(int timeout_ms) {
    if (fd_ < 0) return std::unexpected("not connected");

    while (true) {
        if (auto nl = pending_.find('\n'); nl != std::string::npos) {
            auto doc = nlohmann::json::parse(pending_.substr(0, nl), nullptr, false);
            pending_.erase(0, nl + 1);
            if (doc.is_discarded()) return std::unexpected("malformed response from livecap");
            return doc;
        }

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0 && errno == EINTR) continue;
        if (ready < 0) return std::unexpected(std::string("poll failed: ") + std::strerror(errno));
        if (ready == 0) {
            return std::unexpected(std::format("no response from livecap within {} ms", timeout_ms));
        }

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) return std::unexpected("livecap closed the connection");
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("recv failed: ") + std::strerror(errno));
        }
        pending_.append(chunk, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
