#pragma once

#include "audio_frame.hpp"

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

struct AudioDevice {
    std::string id;    // stable, usable with open()
    std::string name;  // human-readable
};

// Why a frame sequence ended. There is no normal end of stream.
enum class CaptureEnd { Stopped, DeviceLost };

class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual std::vector<AudioDevice> list_devices() = 0;

    // Opens the input with the given id, or the default input when empty.
    virtual std::expected<void, std::string> open(const std::string& device_id) = 0;

    // Blocks until a full frame is buffered, the device goes away, or stop is
    // requested. A stop request must unblock within one frame's duration.
    virtual std::expected<AudioFrame, CaptureEnd> next_frame(std::stop_token stop) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Description of the last DeviceLost, empty otherwise.
    virtual std::string lost_reason() const = 0;
};

// Holds an opened source for the lifetime of a capture loop and closes it
// on every exit path.
class ScopedCapture {
public:
    explicit ScopedCapture(AudioSource& source) : source_(source) {}
    ~ScopedCapture() { source_.close(); }

    ScopedCapture(const ScopedCapture&) = delete;
    ScopedCapture& operator=(const ScopedCapture&) = delete;

private:
    AudioSource& source_;
};
