#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace bhvd::audio {

/// Leaky-integrator memory. Copyable so a sequence can be replayed from any point.
struct BrownNoiseState {
    float lastOut = 0.0f;
};

struct NoiseParameters {
    float smoothing = 0.02f;        // k in (lastOut + k * white) / (1 + k)
    float gainCompensation = 3.5f;
    float subtlety = 0.1f;

    /// Largest absolute sample the parameters can produce.
    float peakAmplitude() const { return gainCompensation * subtlety; }
};

/// Uniform white noise in [-1, 1] from a seeded engine.
class WhiteNoiseSource {
public:
    explicit WhiteNoiseSource(std::uint32_t seed = 0x5eed1234u);

    void seed(std::uint32_t seed);
    float next();

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<float> dist_{-1.0f, 1.0f};
};

struct NoiseStep {
    float sample = 0.0f;
    BrownNoiseState state{};
};

/// Brown noise synthesis. Holds parameters only; all filter memory travels in
/// BrownNoiseState so block and incremental pulls agree sample for sample.
class NoiseGenerator {
public:
    NoiseGenerator() = default;
    explicit NoiseGenerator(const NoiseParameters& params);

    const NoiseParameters& parameters() const { return params_; }

    NoiseStep next(const BrownNoiseState& state, float white) const;
    NoiseStep next(const BrownNoiseState& state, WhiteNoiseSource& source) const;

    /// Writes numSamples mono samples and returns the state after the last one.
    BrownNoiseState generateBlock(const BrownNoiseState& state, WhiteNoiseSource& source,
                                  float* out, std::size_t numSamples) const;

private:
    NoiseParameters params_{};
};

} // namespace bhvd::audio
