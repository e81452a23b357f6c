#include "platform/linux/linux_event_loop.hpp"

#include "model/model_store.hpp"
#include "platform/platform_paths.hpp"
#include "recognizer/vosk_recognizer.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

namespace {

OverlayCore::RecognizerLoader make_vosk_loader(const Config& config) {
    return [model = config.model, sample_rate = config.audio.sample_rate](std::stop_token stop)
               -> std::expected<std::unique_ptr<Recognizer>, CaptionError> {
        ModelStore store(model.resolved_path(), model.name, model.url);
        auto dir = store.ensure(stop);
        if (!dir) {
            return std::unexpected(CaptionError{CaptionErrc::ModelMissing, dir.error()});
        }

        auto recognizer = VoskStreamRecognizer::create(*dir, sample_rate);
        if (!recognizer) {
            return std::unexpected(recognizer.error());
        }
        return std::unique_ptr<Recognizer>(std::move(*recognizer));
    };
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, std::string config_path, bool verbose)
    : config_(std::move(config)), config_path_(std::move(config_path)), verbose_(verbose),
      audio_source_(config_.audio.sample_rate, config_.audio.block_size),
      core_(config_, config_path_, verbose_, audio_source_, overlay_,
            // NotifyCallback, called from the capture and model threads
            [this]() {
                uint64_t val = 1;
                if (::write(notify_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "notify: write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (notify_fd_ >= 0) ::close(notify_fd_);
}

bool LinuxEventLoop::init() {
    // Created first: worker threads may notify as soon as the core starts them.
    notify_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (notify_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto control_path = platform::control_socket_path();
    if (auto listening = control_.listen(control_path); !listening) {
        std::println(stderr, "control: {}", listening.error());
        return false;
    }
    log("Control socket at " + control_path);

    if (!overlay_.open(config_.display)) return false;

    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed for fd {}: {}", fd, std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(control_.listen_fd(), EPOLLIN) ||
        !add_fd(notify_fd_, EPOLLIN) ||
        !add_fd(overlay_.connection_fd(), EPOLLIN)) {
        return false;
    }

    core_.load_model(make_vosk_loader(config_));

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        // Xlib may already hold queued events that never make the fd readable.
        overlay_.process_events();
        if (overlay_.close_requested()) {
            log("Overlay window closed");
            break;
        }

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                handle_signal();
                continue;
            }

            if (fd == control_.listen_fd()) {
                int client_fd = control_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        control_.drop_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == notify_fd_) {
                uint64_t val;
                if (::read(notify_fd_, &val, sizeof(val)) > 0) {
                    core_.on_notify();
                }
                continue;
            }

            if (fd == overlay_.connection_fd()) {
                continue; // drained at the top of the loop
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
    overlay_.close();
}

void LinuxEventLoop::handle_signal() {
    signalfd_siginfo info;
    if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) return;

    if (info.ssi_signo == SIGHUP) {
        if (config_path_.empty() || !std::filesystem::exists(config_path_)) {
            log("SIGHUP: no config file to reload");
            return;
        }
        log("Reloading " + config_path_);
        core_.reload_config(Config::load_or_default(config_path_));
        return;
    }

    log("Received signal, shutting down");
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> requests;
    bool connected = control_.read_requests(fd, requests);

    for (auto& request : requests) {
        if (!control_.reply(fd, core_.handle_command(request))) {
            connected = false;
            break;
        }
    }

    if (!connected) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        control_.drop_client(fd);
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[livecap] {}", msg);
    }
}
