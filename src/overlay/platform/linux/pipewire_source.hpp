#pragma once

#include "platform/audio_source.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

class PipeWireSource : public AudioSource {
public:
    PipeWireSource(uint32_t sample_rate, uint32_t block_size);
    ~PipeWireSource() override;

    PipeWireSource(const PipeWireSource&) = delete;
    PipeWireSource& operator=(const PipeWireSource&) = delete;

    std::vector<AudioDevice> list_devices() override;
    std::expected<void, std::string> open(const std::string& device_id) override;
    std::expected<AudioFrame, CaptureEnd> next_frame(std::stop_token stop) override;
    void close() override;
    bool is_open() const override { return open_.load(std::memory_order_acquire); }
    std::string lost_reason() const override;

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void mark_lost(std::string reason);
    void wake();

    uint32_t sample_rate_;
    uint32_t block_size_;
    SampleRing ring_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> open_{false};
    std::atomic<bool> streaming_{false};
    std::atomic<bool> lost_{false};

    mutable std::mutex mutex_;
    std::condition_variable frame_ready_;
    std::string lost_reason_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
