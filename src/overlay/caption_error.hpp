#pragma once

#include <string>
#include <string_view>

enum class CaptionErrc {
    DeviceError,
    DeviceLost,
    AlreadyRunning,
    ModelMissing,
    RecognizerFault,
};

struct CaptionError {
    CaptionErrc code;
    std::string message;
};

constexpr std::string_view to_string(CaptionErrc code) {
    switch (code) {
        case CaptionErrc::DeviceError: return "device_error";
        case CaptionErrc::DeviceLost: return "device_lost";
        case CaptionErrc::AlreadyRunning: return "already_running";
        case CaptionErrc::ModelMissing: return "model_missing";
        case CaptionErrc::RecognizerFault: return "recognizer_fault";
    }
    return "unknown";
}
