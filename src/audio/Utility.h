#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace bhvd::audio {

inline float linearToDb(float linear) {
    constexpr float kMinLinear = 1e-12f;
    linear = std::max(linear, kMinLinear);
    return 20.0f * std::log10(linear);
}

inline float clamp01(float value) {
    return std::clamp(value, 0.0f, 1.0f);
}

inline std::size_t secondsToSamples(double seconds, double sampleRate) {
    if (seconds <= 0.0 || sampleRate <= 0.0) {
        return 0;
    }
    return static_cast<std::size_t>(std::llround(seconds * sampleRate));
}

} // namespace bhvd::audio
