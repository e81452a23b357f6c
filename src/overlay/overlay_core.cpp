#include "overlay_core.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

json error_response(const CaptionError& err) {
    return {{"status", "error"}, {"code", std::string(to_string(err.code))}, {"message", err.message}};
}

json display_json(const DisplaySettings& d) {
    return {
        {"font_family", d.font_family},
        {"font_size", d.font_size},
        {"text_color", d.text_color},
        {"position", std::string(to_string(d.mode))},
        {"fullscreen", d.fullscreen},
        {"history_lines", d.history_lines},
    };
}

} // namespace

std::string_view to_string(ModelState state) {
    switch (state) {
        case ModelState::Idle: return "idle";
        case ModelState::Loading: return "loading";
        case ModelState::Ready: return "ready";
        case ModelState::Failed: return "failed";
    }
    return "unknown";
}

OverlayCore::OverlayCore(Config config, std::string config_path, bool verbose,
                         AudioSource& audio, CaptionDisplay& display, NotifyCallback notify)
    : config_(std::move(config)), config_path_(std::move(config_path)), verbose_(verbose),
      audio_(audio), display_(display), notify_(std::move(notify)),
      mailbox_(notify_),
      publisher_(mailbox_, &db_, config_.display.history_lines),
      pipeline_(audio_, publisher_,
                CaptionPipeline::Options{config_.pipeline.silence_reset_seconds}, notify_) {}

OverlayCore::~OverlayCore() {
    shutdown();
}

bool OverlayCore::init() {
    if (config_.history.enabled) {
        auto db_path = config_.history.resolved_path();
        if (!db_.open(db_path)) {
            std::println(stderr, "Warning: caption log failed to open, history disabled");
        } else {
            log("Caption log at " + db_path);
        }
    }

    display_.configure(config_.display);
    display_.set_history({});
    display_.set_text({});
    return true;
}

void OverlayCore::load_model(RecognizerLoader loader) {
    if (model_worker_.joinable()) {
        model_worker_.request_stop();
        model_worker_.join();
        model_done_.store(false, std::memory_order_release);
    }

    model_state_ = ModelState::Loading;
    model_error_.clear();
    log("Loading recognition model " + config_.model.name);

    model_worker_ = std::jthread([this, loader = std::move(loader)](std::stop_token stop) {
        auto result = loader(stop);
        {
            std::lock_guard lock(model_mutex_);
            model_result_ = std::move(result);
        }
        model_done_.store(true, std::memory_order_release);
        if (notify_) notify_();
    });
}

void OverlayCore::on_notify() {
    if (model_done_.exchange(false, std::memory_order_acq_rel)) {
        finish_model_load();
    }

    if (auto snapshot = mailbox_.take()) {
        display_.set_history(snapshot->history);
        display_.set_text(snapshot->text);
    }

    auto status = pipeline_.status();
    if (status.state != last_state_) {
        if (status.state == PipelineState::Errored) {
            std::println(stderr, "pipeline: stopped on error: {}", status.reason);
        }
        log(std::format("Pipeline {} -> {}", to_string(last_state_), to_string(status.state)));
        last_state_ = status.state;
    }
}

void OverlayCore::finish_model_load() {
    if (model_worker_.joinable()) {
        model_worker_.join();
    }

    std::optional<std::expected<std::unique_ptr<Recognizer>, CaptionError>> result;
    {
        std::lock_guard lock(model_mutex_);
        result.swap(model_result_);
    }
    if (!result) return;

    if (!result->has_value()) {
        model_state_ = ModelState::Failed;
        model_error_ = result->error().message;
        std::println(stderr, "model: {}", model_error_);
        return;
    }

    if (!pipeline_.attach_recognizer(std::move(result->value()))) {
        model_state_ = ModelState::Failed;
        model_error_ = "pipeline busy while attaching the model";
        std::println(stderr, "model: {}", model_error_);
        return;
    }

    model_state_ = ModelState::Ready;
    log("Recognition model ready");

    if (config_.pipeline.autostart) {
        auto started = start_pipeline(config_.audio.device);
        if (!started) {
            std::println(stderr, "pipeline: autostart failed ({}): {}",
                         to_string(started.error().code), started.error().message);
        }
    }
}

json OverlayCore::handle_command(const json& cmd) {
    if (!cmd.is_object()) {
        return {{"status", "error"}, {"message", "invalid request"}};
    }

    try {
        std::string cmd_str = cmd.value("cmd", "");
        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "devices") return handle_devices(cmd);
        if (cmd_str == "select_device") return handle_select_device(cmd);
        if (cmd_str == "history") return handle_history(cmd);
        if (cmd_str == "configure") return handle_configure(cmd);
    } catch (const json::exception& e) {
        return {{"status", "error"}, {"message", std::string("invalid request: ") + e.what()}};
    }
    return {{"status", "error"}, {"message", "unknown command"}};
}

std::expected<void, CaptionError> OverlayCore::start_pipeline(const std::string& device) {
    // Set before the capture thread starts so its first Final is tagged right.
    publisher_.set_device(device);
    auto started = pipeline_.start(device);
    if (started) {
        log("Captioning started" + (device.empty() ? "" : " on " + device));
    } else {
        // A refused start leaves any running capture on its own device.
        publisher_.set_device(pipeline_.device());
    }
    // The status change is picked up on the next wake-up.
    on_notify();
    return started;
}

json OverlayCore::handle_start(const json& cmd) {
    std::string device = cmd.value("device", config_.audio.device);

    auto started = start_pipeline(device);
    if (!started) {
        return error_response(started.error());
    }
    return {{"status", "ok"}, {"state", "running"}, {"device", device}};
}

json OverlayCore::handle_stop(const json& /*cmd*/) {
    pipeline_.stop();
    on_notify();
    log("Captioning stopped");
    return {{"status", "ok"}, {"state", "stopped"}};
}

json OverlayCore::handle_status(const json& /*cmd*/) {
    auto status = pipeline_.status();
    auto caption = pipeline_.caption_state();
    auto counters = pipeline_.counters();

    json resp = {
        {"status", "ok"},
        {"state", std::string(to_string(status.state))},
        {"caption", caption.current_text},
        {"utterance_open", caption.utterance_open},
        {"device", pipeline_.device()},
        {"model", std::string(to_string(model_state_))},
        {"frames", counters.frames_fed},
        {"recognizer_faults", counters.recognizer_faults},
        {"utterances", counters.utterances},
        {"dropped_updates", mailbox_.overwritten()},
    };
    if (status.state == PipelineState::Errored) resp["reason"] = status.reason;
    if (model_state_ == ModelState::Failed) resp["model_error"] = model_error_;
    return resp;
}

json OverlayCore::handle_devices(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"selected", config_.audio.device},
                 {"devices", json::array()}};
    for (auto& d : audio_.list_devices()) {
        resp["devices"].push_back({{"id", d.id}, {"name", d.name}});
    }
    return resp;
}

json OverlayCore::handle_select_device(const json& cmd) {
    std::string device = cmd.value("device", "");

    if (!device.empty()) {
        auto devices = audio_.list_devices();
        bool known = std::ranges::any_of(devices, [&](const AudioDevice& d) { return d.id == device; });
        if (!known) {
            return error_response({CaptionErrc::DeviceError,
                                   "no input device matching '" + device + "'"});
        }
    }

    config_.audio.device = device;
    persist([&](Config& stored) { stored.audio.device = device; });
    log("Input device set to " + (device.empty() ? std::string("default") : device));
    return {{"status", "ok"}, {"device", device},
            {"message", "device is used from the next start"}};
}

json OverlayCore::handle_history(const json& cmd) {
    int limit = std::clamp(cmd.value("limit", 10), 1, 1000);
    auto entries = db_.recent(limit, cmd.value("search", ""));

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"device", e.device},
        });
    }
    return resp;
}

json OverlayCore::handle_configure(const json& cmd) {
    DisplaySettings settings = config_.display;
    apply_display_json(cmd, settings);

    config_.display = settings;
    apply_display(settings);
    persist([&](Config& stored) { stored.display = settings; });
    return {{"status", "ok"}, {"display", display_json(settings)}};
}

void OverlayCore::apply_display(const DisplaySettings& settings) {
    display_.configure(settings);
    publisher_.set_history_lines(settings.history_lines);
}

void OverlayCore::reload_config(const Config& fresh) {
    config_.display = fresh.display;
    config_.pipeline = fresh.pipeline;
    config_.audio.device = fresh.audio.device;

    apply_display(config_.display);
    pipeline_.set_options({config_.pipeline.silence_reset_seconds});

    if (fresh.audio.sample_rate != config_.audio.sample_rate ||
        fresh.audio.block_size != config_.audio.block_size ||
        fresh.model.resolved_path() != config_.model.resolved_path()) {
        std::println(stderr, "config: audio format and model changes need a restart");
    }
    log("Configuration reloaded");
}

// Re-reads the file so command line overrides for this run stay out of it.
void OverlayCore::persist(const std::function<void(Config&)>& change) {
    if (config_path_.empty()) return;
    Config stored = Config::load_or_default(config_path_);
    change(stored);
    if (!stored.save(config_path_)) {
        std::println(stderr, "config: settings not saved");
    }
}

void OverlayCore::shutdown() {
    pipeline_.stop();
    if (model_worker_.joinable()) {
        model_worker_.request_stop();
        model_worker_.join();
    }
    db_.close();
}

void OverlayCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[livecap] {}", msg);
    }
}
