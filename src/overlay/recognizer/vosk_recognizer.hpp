#pragma once

#include "caption_error.hpp"
#include "recognizer.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

struct VoskModel;
struct VoskRecognizer;

// Extracts `key` ("partial" or "text") from a Vosk result document.
std::expected<std::string, std::string> parse_vosk_result(std::string_view json, const char* key);

class VoskStreamRecognizer : public Recognizer {
    class Key {
        Key() = default;
        friend class VoskStreamRecognizer;
    };

public:
    // Fails with ModelMissing if the model directory is absent or unloadable.
    static std::expected<std::unique_ptr<VoskStreamRecognizer>, CaptionError>
        create(const std::string& model_path, uint32_t sample_rate);

    // Takes ownership of both handles. Only create() can make a Key.
    VoskStreamRecognizer(Key, VoskModel* model, VoskRecognizer* recognizer, uint32_t sample_rate);
    ~VoskStreamRecognizer() override;

    VoskStreamRecognizer(const VoskStreamRecognizer&) = delete;
    VoskStreamRecognizer& operator=(const VoskStreamRecognizer&) = delete;

    std::expected<RecognitionResult, std::string> feed(const AudioFrame& frame) override;
    void reset() override;

private:
    VoskModel* model_ = nullptr;
    VoskRecognizer* recognizer_ = nullptr;
    uint32_t sample_rate_;
};
