#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Accepts livecapctl connections. Requests and responses are single JSON
// documents, one per line. All calls happen on the UI thread.
class ControlServer {
public:
    virtual ~ControlServer() = default;

    // Fails if another overlay is already listening on `endpoint`.
    virtual std::expected<void, std::string> listen(const std::string& endpoint) = 0;
    virtual void shutdown() = 0;

    // Readable when a client is waiting to connect.
    virtual int listen_fd() const = 0;
    virtual int accept_client() = 0;

    // Appends every complete request line received from the client. A line
    // that is not valid JSON is appended as a discarded value. Returns false
    // once the client has disconnected.
    virtual bool read_requests(int client_fd, std::vector<nlohmann::json>& requests) = 0;

    virtual bool reply(int client_fd, const nlohmann::json& response) = 0;
    virtual void drop_client(int client_fd) = 0;
};
