#pragma once

#include "caption_error.hpp"
#include "caption_mailbox.hpp"
#include "caption_pipeline.hpp"
#include "caption_publisher.hpp"
#include "config.hpp"
#include "display/display.hpp"
#include "platform/audio_source.hpp"
#include "recognizer/recognizer.hpp"
#include "storage/transcript_db.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

enum class ModelState { Idle, Loading, Ready, Failed };

std::string_view to_string(ModelState state);

// Platform-independent overlay logic: owns the pipeline, the caption log
// and the hand-off to the display, and answers control commands. Every
// public method runs on the UI thread; the notify callback is the only way
// other threads reach it.
class OverlayCore {
public:
    using NotifyCallback = std::function<void()>;
    using RecognizerLoader =
        std::function<std::expected<std::unique_ptr<Recognizer>, CaptionError>(std::stop_token)>;

    OverlayCore(Config config, std::string config_path, bool verbose,
                AudioSource& audio, CaptionDisplay& display, NotifyCallback notify);
    ~OverlayCore();

    OverlayCore(const OverlayCore&) = delete;
    OverlayCore& operator=(const OverlayCore&) = delete;

    bool init();

    // Runs `loader` on a worker thread; the result is attached on a later
    // on_notify(). Autostarts the pipeline afterwards when configured.
    void load_model(RecognizerLoader loader);

    // Called whenever the notify callback fired.
    void on_notify();

    nlohmann::json handle_command(const nlohmann::json& cmd);

    void reload_config(const Config& fresh);

    void shutdown();

    PipelineStatus pipeline_status() const { return pipeline_.status(); }
    ModelState model_state() const { return model_state_; }
    const Config& config() const { return config_; }

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_devices(const nlohmann::json& cmd);
    nlohmann::json handle_select_device(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_configure(const nlohmann::json& cmd);

    std::expected<void, CaptionError> start_pipeline(const std::string& device);
    void finish_model_load();
    void apply_display(const DisplaySettings& settings);
    void persist(const std::function<void(Config&)>& change);

    void log(const std::string& msg);

    Config config_;
    std::string config_path_;
    bool verbose_;

    AudioSource& audio_;
    CaptionDisplay& display_;
    NotifyCallback notify_;

    CaptionMailbox mailbox_;
    TranscriptDb db_;
    CaptionPublisher publisher_;
    CaptionPipeline pipeline_;

    PipelineState last_state_ = PipelineState::Stopped;

    ModelState model_state_ = ModelState::Idle;
    std::string model_error_;
    std::atomic<bool> model_done_{false};
    std::mutex model_mutex_;
    std::optional<std::expected<std::unique_ptr<Recognizer>, CaptionError>> model_result_;
    std::jthread model_worker_;
};
