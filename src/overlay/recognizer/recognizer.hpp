#pragma once

#include "audio_frame.hpp"

#include <expected>
#include <string>

struct RecognitionResult {
    enum class Kind { Partial, Final };

    Kind kind = Kind::Partial;
    std::string text;

    static RecognitionResult partial(std::string text) { return {Kind::Partial, std::move(text)}; }
    static RecognitionResult final(std::string text) { return {Kind::Final, std::move(text)}; }

    bool is_final() const { return kind == Kind::Final; }
};

// Streaming speech-to-text engine. Stateful and order-sensitive: frames must
// be fed in capture order from a single thread.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    // The error string describes a decode failure for this frame only.
    virtual std::expected<RecognitionResult, std::string> feed(const AudioFrame& frame) = 0;

    // Drops the current utterance.
    virtual void reset() = 0;
};
