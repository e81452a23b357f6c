#pragma once

#include <cstdint>
#include <vector>

// One fixed-size block of mono S16 PCM, handed from the audio source to the
// recognizer exactly once.
struct AudioFrame {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;
    uint64_t sequence = 0;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};
