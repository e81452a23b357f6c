#include "platform/linux/pipewire_source.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <print>
#include <span>
#include <spa/utils/result.h>

namespace {

struct RegistryScan {
    pw_thread_loop* loop = nullptr;
    std::vector<AudioDevice> devices;
    int pending = 0;
    bool done = false;
    bool failed = false;
};

void on_registry_global(void* data, uint32_t /*id*/, uint32_t /*permissions*/,
                        const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* scan = static_cast<RegistryScan*>(data);
    if (!props || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;

    const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
    if (!media_class || std::strcmp(media_class, "Audio/Source") != 0) return;

    const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
    if (!name) return;
    const char* desc = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);

    scan->devices.push_back({name, desc ? desc : name});
}

void on_core_done(void* data, uint32_t id, int seq) {
    auto* scan = static_cast<RegistryScan*>(data);
    if (id == PW_ID_CORE && seq == scan->pending) {
        scan->done = true;
        pw_thread_loop_signal(scan->loop, false);
    }
}

void on_core_error(void* data, uint32_t id, int /*seq*/, int res, const char* message) {
    auto* scan = static_cast<RegistryScan*>(data);
    std::println(stderr, "audio: core error on {}: {} ({})", id,
                 message ? message : "unknown", spa_strerror(res));
    if (id == PW_ID_CORE) {
        scan->failed = true;
        pw_thread_loop_signal(scan->loop, false);
    }
}

constexpr pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_registry_global,
};

constexpr pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
    .error = on_core_error,
};

} // namespace

PipeWireSource::PipeWireSource(uint32_t sample_rate, uint32_t block_size)
    : sample_rate_(sample_rate), block_size_(block_size),
      ring_(static_cast<size_t>(block_size) * 8) {
    pw_init(nullptr, nullptr);
}

PipeWireSource::~PipeWireSource() {
    close();
    pw_deinit();
}

std::vector<AudioDevice> PipeWireSource::list_devices() {
    RegistryScan scan;

    scan.loop = pw_thread_loop_new("livecap-scan", nullptr);
    if (!scan.loop) {
        std::println(stderr, "audio: failed to create scan loop");
        return {};
    }

    pw_context* context = pw_context_new(pw_thread_loop_get_loop(scan.loop), nullptr, 0);
    if (!context) {
        std::println(stderr, "audio: failed to create context");
        pw_thread_loop_destroy(scan.loop);
        return {};
    }

    if (pw_thread_loop_start(scan.loop) < 0) {
        std::println(stderr, "audio: scan loop start failed");
        pw_context_destroy(context);
        pw_thread_loop_destroy(scan.loop);
        return {};
    }

    pw_thread_loop_lock(scan.loop);

    pw_core* core = pw_context_connect(context, nullptr, 0);
    if (!core) {
        std::println(stderr, "audio: cannot connect to PipeWire: {}", std::strerror(errno));
        pw_thread_loop_unlock(scan.loop);
        pw_thread_loop_stop(scan.loop);
        pw_context_destroy(context);
        pw_thread_loop_destroy(scan.loop);
        return {};
    }

    pw_registry* registry = pw_core_get_registry(core, PW_VERSION_REGISTRY, 0);

    spa_hook registry_listener{};
    spa_hook core_listener{};
    pw_registry_add_listener(registry, &registry_listener, &registry_events, &scan);
    pw_core_add_listener(core, &core_listener, &core_events, &scan);

    scan.pending = pw_core_sync(core, PW_ID_CORE, 0);
    while (!scan.done && !scan.failed) {
        if (pw_thread_loop_timed_wait(scan.loop, 5) != 0) {
            std::println(stderr, "audio: device scan timed out");
            break;
        }
    }

    spa_hook_remove(&registry_listener);
    spa_hook_remove(&core_listener);
    pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry));
    pw_core_disconnect(core);
    pw_thread_loop_unlock(scan.loop);

    pw_thread_loop_stop(scan.loop);
    pw_context_destroy(context);
    pw_thread_loop_destroy(scan.loop);

    std::ranges::sort(scan.devices, {}, &AudioDevice::name);
    return scan.devices;
}

std::expected<void, std::string> PipeWireSource::open(const std::string& device_id) {
    if (is_open()) {
        return std::unexpected("capture stream is already open");
    }

    auto devices = list_devices();
    if (devices.empty()) {
        return std::unexpected("no audio input device available");
    }
    if (!device_id.empty() &&
        std::ranges::none_of(devices, [&](const AudioDevice& d) { return d.id == device_id; })) {
        return std::unexpected("no input device matching '" + device_id + "'");
    }

    loop_ = pw_thread_loop_new("livecap-capture", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "livecap",
        PW_KEY_APP_NAME, "livecap",
        nullptr
    );
    if (!device_id.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, device_id.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "livecap-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected("failed to create stream");
    }

    // S16_LE, mono, at the recognizer's rate
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    auto flags = PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS |
                 PW_STREAM_FLAG_RT_PROCESS;
    if (!device_id.empty()) {
        flags = flags | PW_STREAM_FLAG_DONT_RECONNECT;
    }

    ring_.reset();
    next_sequence_ = 0;
    lost_.store(false, std::memory_order_release);
    {
        std::lock_guard lock(mutex_);
        lost_reason_.clear();
    }

    int ret = pw_stream_connect(stream_, PW_DIRECTION_INPUT, PW_ID_ANY,
                                static_cast<pw_stream_flags>(flags), params, 1);
    if (ret < 0) {
        std::string err = std::string("stream connect failed: ") + spa_strerror(ret);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected(err);
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::string err = std::string("thread loop start failed: ") + spa_strerror(ret);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected(err);
    }

    open_.store(true, std::memory_order_release);
    return {};
}

std::expected<AudioFrame, CaptureEnd> PipeWireSource::next_frame(std::stop_token stop) {
    // Wait slices are bounded so a missed notify costs at most one slice.
    const auto slice = std::chrono::milliseconds(
        std::max<uint32_t>(10, block_size_ * 1000 / std::max<uint32_t>(sample_rate_, 1) / 4));

    std::stop_callback on_stop(stop, [this] { wake(); });

    std::unique_lock lock(mutex_);
    while (true) {
        if (stop.stop_requested()) return std::unexpected(CaptureEnd::Stopped);
        if (ring_.available() >= block_size_) break;
        if (lost_.load(std::memory_order_acquire)) return std::unexpected(CaptureEnd::DeviceLost);
        frame_ready_.wait_for(lock, slice);
    }
    lock.unlock();

    AudioFrame frame;
    frame.samples = ring_.take(block_size_);
    frame.sample_rate = sample_rate_;
    frame.sequence = next_sequence_++;
    return frame;
}

void PipeWireSource::close() {
    if (!open_.exchange(false, std::memory_order_acq_rel)) return;

    streaming_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }

    if (size_t dropped = ring_.dropped(); dropped > 0) {
        std::println(stderr, "audio: {} samples dropped (capture fell behind)", dropped);
    }
    wake();
}

std::string PipeWireSource::lost_reason() const {
    std::lock_guard lock(mutex_);
    return lost_reason_;
}

void PipeWireSource::mark_lost(std::string reason) {
    {
        std::lock_guard lock(mutex_);
        lost_reason_ = std::move(reason);
    }
    lost_.store(true, std::memory_order_release);
    wake();
}

void PipeWireSource::wake() {
    frame_ready_.notify_all();
}

void PipeWireSource::on_process(void* userdata) {
    auto* self = static_cast<PipeWireSource*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data || !d->chunk) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(int16_t);

    if (self->open_.load(std::memory_order_relaxed)) {
        self->ring_.write(std::span<const int16_t>(data, count));
        if (self->ring_.available() >= self->block_size_) {
            self->wake();
        }
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireSource::on_state_changed(void* userdata, enum pw_stream_state old,
                                      enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireSource*>(userdata);

    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }

    if (!self->open_.load(std::memory_order_acquire)) return;

    switch (state) {
        case PW_STREAM_STATE_STREAMING:
            self->streaming_.store(true, std::memory_order_release);
            break;
        case PW_STREAM_STATE_ERROR:
            self->mark_lost(error ? error : "audio stream error");
            break;
        case PW_STREAM_STATE_UNCONNECTED:
            if (self->streaming_.load(std::memory_order_acquire)) {
                self->mark_lost("audio input device disconnected");
            }
            break;
        default:
            break;
    }
}
