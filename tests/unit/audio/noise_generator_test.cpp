// =============================================================================
// NoiseGenerator Tests
// =============================================================================
// Brown noise leaky integrator: determinism, amplitude bound, block/incremental
// equivalence.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "audio/NoiseGenerator.h"

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace bhvd::audio;

namespace {

constexpr std::size_t kSampleCount = 10000;
constexpr std::uint32_t kSeed = 42;

std::vector<float> renderIncremental(std::uint32_t seed, std::size_t count) {
    NoiseGenerator generator;
    WhiteNoiseSource source(seed);
    BrownNoiseState state;
    std::vector<float> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const NoiseStep step = generator.next(state, source);
        out.push_back(step.sample);
        state = step.state;
    }
    return out;
}

} // namespace

TEST_CASE("NoiseGenerator applies the leaky integrator formula", "[audio][noise]") {
    NoiseGenerator generator;

    SECTION("first step from silence") {
        const NoiseStep step = generator.next(BrownNoiseState{}, 1.0f);
        REQUIRE(step.state.lastOut == Approx(0.02f / 1.02f));
        REQUIRE(step.sample == Approx(0.02f / 1.02f * 3.5f * 0.1f));
    }

    SECTION("state carries into the next step") {
        BrownNoiseState state{0.5f};
        const NoiseStep step = generator.next(state, -1.0f);
        REQUIRE(step.state.lastOut == Approx((0.5f - 0.02f) / 1.02f));
    }

    SECTION("input is clamped to the white noise range") {
        const NoiseStep clamped = generator.next(BrownNoiseState{}, 5.0f);
        const NoiseStep unit = generator.next(BrownNoiseState{}, 1.0f);
        REQUIRE(clamped.sample == Approx(unit.sample));
    }

    SECTION("same state and input give the same output") {
        const BrownNoiseState state{0.125f};
        REQUIRE(generator.next(state, 0.3f).sample == generator.next(state, 0.3f).sample);
    }
}

TEST_CASE("Seeded noise is deterministic and bounded", "[audio][noise]") {
    const auto first = renderIncremental(kSeed, kSampleCount);
    const auto second = renderIncremental(kSeed, kSampleCount);
    REQUIRE(first == second);

    const float bound = NoiseParameters{}.peakAmplitude();
    REQUIRE(bound == Approx(0.35f));
    for (float sample : first) {
        REQUIRE(std::isfinite(sample));
        REQUIRE(std::abs(sample) <= bound);
    }

    SECTION("different seeds diverge") {
        const auto other = renderIncremental(kSeed + 1, kSampleCount);
        REQUIRE(other != first);
    }
}

TEST_CASE("Block and incremental generation agree sample for sample", "[audio][noise]") {
    const auto incremental = renderIncremental(kSeed, kSampleCount);

    NoiseGenerator generator;
    WhiteNoiseSource source(kSeed);
    std::vector<float> block(kSampleCount, 0.0f);

    // Split across uneven blocks to check that state carries between calls.
    BrownNoiseState state;
    std::size_t offset = 0;
    for (std::size_t chunk : {1u, 511u, 512u, 3000u}) {
        state = generator.generateBlock(state, source, block.data() + offset, chunk);
        offset += chunk;
    }
    state = generator.generateBlock(state, source, block.data() + offset, kSampleCount - offset);

    REQUIRE(block == incremental);
}

TEST_CASE("Brown noise is dominated by low frequencies", "[audio][noise]") {
    const auto samples = renderIncremental(kSeed, kSampleCount);

    // Adjacent samples of integrated noise are strongly correlated; white noise is not.
    double energy = 0.0;
    double lagOne = 0.0;
    for (std::size_t i = 1; i < samples.size(); ++i) {
        energy += static_cast<double>(samples[i]) * samples[i];
        lagOne += static_cast<double>(samples[i]) * samples[i - 1];
    }
    REQUIRE(energy > 0.0);
    REQUIRE(lagOne / energy > 0.9);
}
