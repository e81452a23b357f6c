#pragma once

#include "caption_sink.hpp"
#include "display/display.hpp"
#include "platform/audio_source.hpp"
#include "recognizer/recognizer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

// Polls `pred` until it holds or `timeout` passes.
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

inline AudioFrame make_frame(size_t samples = 8000, uint32_t rate = 16000) {
    AudioFrame f;
    f.samples.assign(samples, int16_t(0));
    f.sample_rate = rate;
    return f;
}

// Hands out frames queued by the test, in order.
class MockAudioSource : public AudioSource {
public:
    explicit MockAudioSource(std::vector<AudioDevice> devices = {{"mic", "Test Microphone"}})
        : devices_(std::move(devices)) {}

    std::vector<AudioDevice> list_devices() override {
        std::lock_guard lock(mutex_);
        return devices_;
    }

    std::expected<void, std::string> open(const std::string& device_id) override {
        std::lock_guard lock(mutex_);
        if (open_) return std::unexpected("already open");
        if (devices_.empty()) return std::unexpected("no audio input device available");
        if (!device_id.empty() &&
            std::ranges::none_of(devices_, [&](const AudioDevice& d) { return d.id == device_id; })) {
            return std::unexpected("no input device matching '" + device_id + "'");
        }
        open_ = true;
        lost_ = false;
        lost_reason_.clear();
        ++opens_;
        last_device_ = device_id;
        return {};
    }

    std::expected<AudioFrame, CaptureEnd> next_frame(std::stop_token stop) override {
        std::stop_callback wake(stop, [this] { cv_.notify_all(); });
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return stop.stop_requested() || lost_ || !frames_.empty(); });
        if (stop.stop_requested()) return std::unexpected(CaptureEnd::Stopped);
        if (frames_.empty()) return std::unexpected(CaptureEnd::DeviceLost);
        AudioFrame f = std::move(frames_.front());
        frames_.pop_front();
        f.sequence = sequence_++;
        return f;
    }

    void close() override {
        std::lock_guard lock(mutex_);
        if (!open_) return;
        open_ = false;
        ++closes_;
    }

    bool is_open() const override {
        std::lock_guard lock(mutex_);
        return open_;
    }

    std::string lost_reason() const override {
        std::lock_guard lock(mutex_);
        return lost_reason_;
    }

    void push(AudioFrame frame) {
        {
            std::lock_guard lock(mutex_);
            frames_.push_back(std::move(frame));
        }
        cv_.notify_all();
    }

    void push_frames(size_t count) {
        for (size_t i = 0; i < count; ++i) push(make_frame());
    }

    // Simulates the device disappearing once queued frames are consumed.
    void lose(std::string reason) {
        {
            std::lock_guard lock(mutex_);
            lost_ = true;
            lost_reason_ = std::move(reason);
        }
        cv_.notify_all();
    }

    void set_devices(std::vector<AudioDevice> devices) {
        std::lock_guard lock(mutex_);
        devices_ = std::move(devices);
    }

    int opens() const { std::lock_guard lock(mutex_); return opens_; }
    int closes() const { std::lock_guard lock(mutex_); return closes_; }
    size_t queued() const { std::lock_guard lock(mutex_); return frames_.size(); }
    std::string last_device() const { std::lock_guard lock(mutex_); return last_device_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<AudioDevice> devices_;
    std::deque<AudioFrame> frames_;
    bool open_ = false;
    bool lost_ = false;
    std::string lost_reason_;
    std::string last_device_;
    uint64_t sequence_ = 0;
    int opens_ = 0;
    int closes_ = 0;
};

// Returns scripted results in order, then empty partials.
class ScriptedRecognizer : public Recognizer {
public:
    struct Step {
        std::expected<RecognitionResult, std::string> result;
        bool raise = false;
    };

    static Step partial(std::string text) { return {RecognitionResult::partial(std::move(text))}; }
    static Step final(std::string text) { return {RecognitionResult::final(std::move(text))}; }
    static Step fault(std::string why) { return {std::unexpected(std::move(why))}; }
    static Step thrown(std::string why) { return {std::unexpected(std::move(why)), true}; }

    explicit ScriptedRecognizer(std::vector<Step> steps = {},
                                std::atomic<int>* resets = nullptr,
                                std::atomic<int>* feeds = nullptr)
        : steps_(std::move(steps)), resets_(resets), feeds_(feeds) {}

    std::expected<RecognitionResult, std::string> feed(const AudioFrame& /*frame*/) override {
        if (feeds_) ++*feeds_;
        if (next_ >= steps_.size()) return RecognitionResult::partial({});
        auto& step = steps_[next_++];
        if (step.raise) throw std::runtime_error(step.result.error());
        return step.result;
    }

    void reset() override {
        if (resets_) ++*resets_;
    }

private:
    std::vector<Step> steps_;
    size_t next_ = 0;
    std::atomic<int>* resets_;
    std::atomic<int>* feeds_;
};

class RecordingSink : public CaptionSink {
public:
    void publish(const Caption& caption) override {
        std::lock_guard lock(mutex_);
        captions_.push_back(caption);
    }

    std::vector<Caption> captions() const {
        std::lock_guard lock(mutex_);
        return captions_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return captions_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Caption> captions_;
};

class RecordingDisplay : public CaptionDisplay {
public:
    void set_text(const std::string& text) override { texts.push_back(text); }
    void set_history(const std::vector<std::string>& lines) override { history = lines; }
    void configure(const DisplaySettings& s) override {
        settings = s;
        ++configures;
    }

    std::vector<std::string> texts;
    std::vector<std::string> history;
    DisplaySettings settings;
    int configures = 0;
};
