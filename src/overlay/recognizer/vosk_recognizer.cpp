#include "recognizer/vosk_recognizer.hpp"

#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <vosk_api.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::expected<std::string, std::string> parse_vosk_result(std::string_view doc, const char* key) {
    try {
        auto j = json::parse(doc);
        if (!j.is_object()) {
            return std::unexpected("result is not an object");
        }
        return j.value(key, std::string{});
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<std::unique_ptr<VoskStreamRecognizer>, CaptionError>
VoskStreamRecognizer::create(const std::string& model_path, uint32_t sample_rate) {
    std::error_code ec;
    if (!fs::is_directory(model_path, ec)) {
        return std::unexpected(CaptionError{
            CaptionErrc::ModelMissing, "model directory not found: " + model_path});
    }

    vosk_set_log_level(-1);

    VoskModel* model = vosk_model_new(model_path.c_str());
    if (!model) {
        return std::unexpected(CaptionError{
            CaptionErrc::ModelMissing, "failed to load Vosk model at " + model_path});
    }

    VoskRecognizer* rec = vosk_recognizer_new(model, static_cast<float>(sample_rate));
    if (!rec) {
        vosk_model_free(model);
        return std::unexpected(CaptionError{
            CaptionErrc::ModelMissing, "failed to create Vosk recognizer"});
    }
    vosk_recognizer_set_max_alternatives(rec, 0);
    vosk_recognizer_set_partial_words(rec, 0);

    return std::make_unique<VoskStreamRecognizer>(Key{}, model, rec, sample_rate);
}

VoskStreamRecognizer::VoskStreamRecognizer(Key, VoskModel* model, VoskRecognizer* recognizer,
                                           uint32_t sample_rate)
    : model_(model), recognizer_(recognizer), sample_rate_(sample_rate) {}

VoskStreamRecognizer::~VoskStreamRecognizer() {
    if (recognizer_) vosk_recognizer_free(recognizer_);
    if (model_) vosk_model_free(model_);
}

std::expected<RecognitionResult, std::string>
VoskStreamRecognizer::feed(const AudioFrame& frame) {
    if (frame.sample_rate != sample_rate_) {
        return std::unexpected(std::format("frame rate {} does not match recognizer rate {}",
                                           frame.sample_rate, sample_rate_));
    }

    int rc = vosk_recognizer_accept_waveform_s(recognizer_, frame.samples.data(),
                                               static_cast<int>(frame.samples.size()));
    if (rc < 0) {
        return std::unexpected(std::format("decode failed on frame {}", frame.sequence));
    }

    if (rc > 0) {
        auto text = parse_vosk_result(vosk_recognizer_result(recognizer_), "text");
        if (!text) return std::unexpected(text.error());
        return RecognitionResult::final(std::move(*text));
    }

    auto text = parse_vosk_result(vosk_recognizer_partial_result(recognizer_), "partial");
    if (!text) return std::unexpected(text.error());
    return RecognitionResult::partial(std::move(*text));
}

void VoskStreamRecognizer::reset() {
    vosk_recognizer_reset(recognizer_);
}
