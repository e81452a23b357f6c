#pragma once

#include "platform/control_server.hpp"

#include <cstddef>
#include <string>
#include <vector>

// ControlServer on a Unix stream socket, readable by the owner only.
// Sockets are non-blocking; partial request lines are kept per client.
class UnixSocketServer : public ControlServer {
public:
    UnixSocketServer() = default;
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    std::expected<void, std::string> listen(const std::string& endpoint) override;
    void shutdown() override;
    int listen_fd() const override { return listen_fd_; }
    int accept_client() override;
    bool read_requests(int client_fd, std::vector<nlohmann::json>& requests) override;
    bool reply(int client_fd, const nlohmann::json& response) override;
    void drop_client(int client_fd) override;

    size_t client_count() const { return clients_.size(); }

    // A client sending more than this without a newline is dropped.
    static constexpr size_t kMaxLineBytes = 64 * 1024;
    static constexpr size_t kMaxClients = 16;

private:
    struct Client {
        int fd;
        std::string pending;
    };

    Client* find_client(int fd);

    int listen_fd_ = -1;
    std::string socket_path_;
    std::vector<Client> clients_;
};
