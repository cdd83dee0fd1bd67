#include "NoiseGenerator.h"

#include <algorithm>

namespace bhvd::audio {

WhiteNoiseSource::WhiteNoiseSource(std::uint32_t seed)
    : rng_(seed) {}

void WhiteNoiseSource::seed(std::uint32_t seed) {
    rng_.seed(seed);
    dist_.reset();
}

float WhiteNoiseSource::next() {
    return dist_(rng_);
}

NoiseGenerator::NoiseGenerator(const NoiseParameters& params)
    : params_(params) {
    params_.smoothing = std::max(params_.smoothing, 0.0f);
}

NoiseStep NoiseGenerator::next(const BrownNoiseState& state, float white) const {
    const float k = params_.smoothing;
    const float clampedWhite = std::clamp(white, -1.0f, 1.0f);

    NoiseStep step;
    step.state.lastOut = (state.lastOut + k * clampedWhite) / (1.0f + k);
    step.sample = step.state.lastOut * params_.gainCompensation * params_.subtlety;
    return step;
}

NoiseStep NoiseGenerator::next(const BrownNoiseState& state, WhiteNoiseSource& source) const {
    return next(state, source.next());
}

BrownNoiseState NoiseGenerator::generateBlock(const BrownNoiseState& state, WhiteNoiseSource& source,
                                              float* out, std::size_t numSamples) const {
    BrownNoiseState current = state;
    for (std::size_t i = 0; i < numSamples; ++i) {
        const NoiseStep step = next(current, source);
        out[i] = step.sample;
        current = step.state;
    }
    return current;
}

} // namespace bhvd::audio
