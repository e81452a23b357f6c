#pragma once

#include "caption_error.hpp"
#include "caption_sink.hpp"
#include "platform/audio_source.hpp"
#include "recognizer/recognizer.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

enum class PipelineState { Stopped, Running, Errored };

std::string_view to_string(PipelineState state);

struct PipelineStatus {
    PipelineState state = PipelineState::Stopped;
    std::string reason; // set when Errored
};

struct CaptionState {
    std::string current_text;
    bool utterance_open = false;
};

struct PipelineCounters {
    uint64_t frames_fed = 0;
    uint64_t recognizer_faults = 0;
    uint64_t utterances = 0;
};

// Streams frames from an AudioSource through a Recognizer on a dedicated
// capture thread and publishes captions to a CaptionSink.
//
// start()/stop()/reset() are called from the UI thread. The recognizer,
// the frame loop and sink publishing run only on the capture thread.
// Device loss moves the pipeline to Errored and calls the notify callback;
// it stays there until stop(), reset() or the next start().
class CaptionPipeline {
public:
    using NotifyCallback = std::function<void()>;

    struct Options {
        // Commit an open utterance after this much audio without a new
        // partial. Zero disables.
        double silence_reset_seconds = 0.0;
    };

    CaptionPipeline(AudioSource& source, CaptionSink& sink, Options options = {},
                    NotifyCallback notify = {});
    ~CaptionPipeline();

    CaptionPipeline(const CaptionPipeline&) = delete;
    CaptionPipeline& operator=(const CaptionPipeline&) = delete;

    // Fails while running.
    bool attach_recognizer(std::unique_ptr<Recognizer> recognizer);
    bool has_recognizer() const;

    std::expected<void, CaptionError> start(const std::string& device_id = {});
    void stop();
    void reset();

    // Takes effect on the next start().
    void set_options(const Options& options);

    PipelineStatus status() const;
    CaptionState caption_state() const;
    PipelineCounters counters() const;
    std::string device() const;

private:
    void stop_locked();
    void run(std::stop_token stop);
    void handle_frame(const AudioFrame& frame);
    void apply_partial(const std::string& text, const AudioFrame& frame);
    void commit(const std::string& text);
    void tick_silence(const AudioFrame& frame);
    void enter_errored(const std::string& reason);
    void publish(const std::string& text, bool final);
    void set_status(PipelineState state, std::string reason = {});

    AudioSource& source_;
    CaptionSink& sink_;
    NotifyCallback notify_;

    mutable std::mutex control_mutex_;
    std::unique_ptr<Recognizer> recognizer_;
    Options pending_options_;

    mutable std::mutex state_mutex_;
    PipelineStatus status_;
    CaptionState caption_;
    PipelineCounters counters_;
    std::string device_;

    // Capture thread only while running.
    Options options_;
    uint64_t samples_since_change_ = 0;

    std::jthread worker_;
};
