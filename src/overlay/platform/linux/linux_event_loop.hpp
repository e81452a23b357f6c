#pragma once

#include "config.hpp"
#include "overlay_core.hpp"
#include "platform/linux/pipewire_source.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/x11_overlay.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, std::string config_path, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_signal();
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    std::string config_path_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PipeWireSource audio_source_;
    X11Overlay overlay_;
    UnixSocketServer control_;

    // Portable overlay logic
    OverlayCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int notify_fd_ = -1;

    std::atomic<bool> running_{false};
};
