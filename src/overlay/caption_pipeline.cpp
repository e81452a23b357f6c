#include "caption_pipeline.hpp"

#include <print>

std::string_view to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Stopped: return "stopped";
        case PipelineState::Running: return "running";
        case PipelineState::Errored: return "errored";
    }
    return "unknown";
}

CaptionPipeline::CaptionPipeline(AudioSource& source, CaptionSink& sink, Options options,
                                 NotifyCallback notify)
    : source_(source), sink_(sink), notify_(std::move(notify)),
      pending_options_(options), options_(options) {}

CaptionPipeline::~CaptionPipeline() {
    stop();
}

bool CaptionPipeline::attach_recognizer(std::unique_ptr<Recognizer> recognizer) {
    std::lock_guard lock(control_mutex_);
    if (worker_.joinable()) return false;
    recognizer_ = std::move(recognizer);
    return true;
}

bool CaptionPipeline::has_recognizer() const {
    std::lock_guard lock(control_mutex_);
    return recognizer_ != nullptr;
}

std::expected<void, CaptionError> CaptionPipeline::start(const std::string& device_id) {
    std::lock_guard lock(control_mutex_);

    switch (status().state) {
        case PipelineState::Running:
            return std::unexpected(CaptionError{
                CaptionErrc::AlreadyRunning, "pipeline is already running"});
        case PipelineState::Errored:
            stop_locked();
            break;
        case PipelineState::Stopped:
            break;
    }

    if (!recognizer_) {
        return std::unexpected(CaptionError{
            CaptionErrc::ModelMissing, "recognition model is not loaded yet"});
    }

    auto opened = source_.open(device_id);
    if (!opened) {
        return std::unexpected(CaptionError{CaptionErrc::DeviceError, opened.error()});
    }

    recognizer_->reset();
    options_ = pending_options_;
    samples_since_change_ = 0;
    {
        std::lock_guard state_lock(state_mutex_);
        caption_.utterance_open = false;
        device_ = device_id;
    }
    set_status(PipelineState::Running);

    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
    return {};
}

void CaptionPipeline::stop() {
    std::lock_guard lock(control_mutex_);
    stop_locked();
}

void CaptionPipeline::reset() {
    std::lock_guard lock(control_mutex_);
    if (status().state != PipelineState::Errored) return;
    stop_locked();
}

void CaptionPipeline::stop_locked() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }

    if (status().state == PipelineState::Stopped) return;

    // The capture loop closes the source on exit; this covers a loop that
    // never got to run.
    if (source_.is_open()) source_.close();

    if (recognizer_) recognizer_->reset();
    {
        std::lock_guard state_lock(state_mutex_);
        caption_.utterance_open = false;
    }
    set_status(PipelineState::Stopped);
}

void CaptionPipeline::set_options(const Options& options) {
    std::lock_guard lock(control_mutex_);
    pending_options_ = options;
}

PipelineStatus CaptionPipeline::status() const {
    std::lock_guard lock(state_mutex_);
    return status_;
}

CaptionState CaptionPipeline::caption_state() const {
    std::lock_guard lock(state_mutex_);
    return caption_;
}

PipelineCounters CaptionPipeline::counters() const {
    std::lock_guard lock(state_mutex_);
    return counters_;
}

std::string CaptionPipeline::device() const {
    std::lock_guard lock(state_mutex_);
    return device_;
}

void CaptionPipeline::run(std::stop_token stop) {
    ScopedCapture capture(source_);

    try {
        while (!stop.stop_requested()) {
            auto frame = source_.next_frame(stop);
            if (!frame) {
                if (frame.error() == CaptureEnd::DeviceLost) {
                    auto reason = source_.lost_reason();
                    enter_errored(reason.empty() ? "audio device lost" : reason);
                }
                return;
            }
            handle_frame(*frame);
        }
    } catch (const std::exception& e) {
        std::println(stderr, "pipeline: capture loop failed: {}", e.what());
        enter_errored(e.what());
    }
}

void CaptionPipeline::handle_frame(const AudioFrame& frame) {
    auto result = recognizer_->feed(frame);
    {
        std::lock_guard lock(state_mutex_);
        ++counters_.frames_fed;
        if (!result) ++counters_.recognizer_faults;
    }

    if (!result) {
        std::println(stderr, "pipeline: recognizer fault on frame {}: {}",
                     frame.sequence, result.error());
        return;
    }

    if (result->is_final()) {
        samples_since_change_ = 0;
        if (result->text.empty()) {
            std::lock_guard lock(state_mutex_);
            caption_.utterance_open = false;
            return;
        }
        commit(result->text);
        return;
    }

    if (result->text.empty()) {
        tick_silence(frame);
        return;
    }
    apply_partial(result->text, frame);
}

void CaptionPipeline::apply_partial(const std::string& text, const AudioFrame& frame) {
    bool changed;
    {
        std::lock_guard lock(state_mutex_);
        changed = !caption_.utterance_open || caption_.current_text != text;
        caption_.current_text = text;
        caption_.utterance_open = true;
    }

    if (!changed) {
        tick_silence(frame);
        return;
    }
    samples_since_change_ = 0;
    publish(text, false);
}

void CaptionPipeline::commit(const std::string& text) {
    {
        std::lock_guard lock(state_mutex_);
        caption_.current_text = text;
    }
    publish(text, true);
    {
        std::lock_guard lock(state_mutex_);
        caption_.utterance_open = false;
        ++counters_.utterances;
    }
    samples_since_change_ = 0;
}

void CaptionPipeline::tick_silence(const AudioFrame& frame) {
    if (options_.silence_reset_seconds <= 0.0) return;

    std::string pending;
    {
        std::lock_guard lock(state_mutex_);
        if (!caption_.utterance_open) return;
        pending = caption_.current_text;
    }

    samples_since_change_ += frame.samples.size();
    double limit = options_.silence_reset_seconds * frame.sample_rate;
    if (static_cast<double>(samples_since_change_) < limit) return;

    recognizer_->reset();
    commit(pending);
}

void CaptionPipeline::enter_errored(const std::string& reason) {
    {
        std::lock_guard lock(state_mutex_);
        caption_.current_text.clear();
        caption_.utterance_open = false;
    }
    publish({}, false);
    set_status(PipelineState::Errored, reason);
    if (notify_) notify_();
}

void CaptionPipeline::publish(const std::string& text, bool final) {
    sink_.publish(Caption{text, final});
}

void CaptionPipeline::set_status(PipelineState state, std::string reason) {
    std::lock_guard lock(state_mutex_);
    status_ = PipelineStatus{state, std::move(reason)};
}
