// =============================================================================
// AudioEngine Tests
// =============================================================================
// Lifecycle and fades on a manual clock against a fake output device.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "audio/AudioEngine.h"
#include "test_helpers/fake_audio_output.h"
#include "test_helpers/manual_clock.h"

#include "ofSoundBuffer.h"

#include <cmath>
#include <memory>

using Catch::Approx;
using namespace bhvd;
using namespace bhvd::audio;

namespace {

struct EngineFixture {
    std::shared_ptr<test::FakeAudioOutputLog> log = std::make_shared<test::FakeAudioOutputLog>();
    test::ManualClock clock;
    std::unique_ptr<AudioEngine> engine;

    // The callback watchdog is off unless a test drives audioOut() itself.
    explicit EngineFixture(double loopSeconds = 0.0, double callbackTimeoutSeconds = 0.0) {
        AudioEngineSettings settings;
        settings.targetVolume = 0.5f;
        settings.fadeInSeconds = 2.0;
        settings.fadeOutSeconds = 1.0;
        settings.loopSeconds = loopSeconds;
        settings.seed = 7;
        settings.callbackTimeoutSeconds = callbackTimeoutSeconds;
        engine = std::make_unique<AudioEngine>(std::make_unique<test::FakeAudioOutput>(log), settings,
                                               clock.clock());
    }

    void advance(double seconds) {
        clock.advance(seconds);
        engine->update();
    }

    void playToSteadyState() {
        engine->start();
        advance(2.0);
    }

    EngineStatus status() const { return engine->state().status; }
};

ofSoundBuffer makeBuffer(std::size_t frames = 256) {
    ofSoundBuffer buffer;
    buffer.setSampleRate(48000);
    buffer.allocate(frames, 2);
    return buffer;
}

} // namespace

TEST_CASE("AudioEngine initialize acquires the device", "[audio][engine]") {
    EngineFixture f;
    REQUIRE(f.status() == EngineStatus::Uninitialized);

    REQUIRE(f.engine->initialize());
    REQUIRE(f.status() == EngineStatus::Idle);
    REQUIRE(f.log->openCalls == 1);
    REQUIRE(f.log->listener == f.engine.get());

    SECTION("second initialize is a no-op") {
        REQUIRE(f.engine->initialize());
        REQUIRE(f.log->openCalls == 1);
    }
}

TEST_CASE("AudioEngine degrades when no device is available", "[audio][engine]") {
    EngineFixture f;
    f.log->failOpen = true;

    REQUIRE_FALSE(f.engine->initialize());
    REQUIRE(f.status() == EngineStatus::Uninitialized);
    const auto error = f.engine->popError();
    REQUIRE(error.has_value());
    REQUIRE(error->code == ErrorCode::DeviceUnavailable);

    SECTION("start stays silent without throwing") {
        f.engine->start();
        REQUIRE_FALSE(f.engine->isAudible());
        REQUIRE(f.engine->currentGain() == Approx(0.0f));
    }
}

TEST_CASE("AudioEngine fades in to the target volume", "[audio][engine]") {
    EngineFixture f;
    f.engine->initialize();
    f.engine->start();

    REQUIRE(f.status() == EngineStatus::FadingIn);
    REQUIRE(f.log->startCalls == 1);
    REQUIRE(f.engine->currentGain() == Approx(0.0f));

    f.advance(1.0);
    REQUIRE(f.status() == EngineStatus::FadingIn);
    REQUIRE(f.engine->currentGain() == Approx(0.25f));

    f.advance(1.0);
    REQUIRE(f.status() == EngineStatus::Playing);
    REQUIRE(f.engine->currentGain() == Approx(0.5f));
    REQUIRE_FALSE(f.engine->activeEnvelope().has_value());

    SECTION("start while playing is a no-op") {
        f.engine->start();
        REQUIRE(f.status() == EngineStatus::Playing);
        REQUIRE(f.log->startCalls == 1);
    }
}

TEST_CASE("AudioEngine start initializes on demand", "[audio][engine]") {
    EngineFixture f;
    f.engine->start();
    REQUIRE(f.log->openCalls == 1);
    REQUIRE(f.status() == EngineStatus::FadingIn);
}

TEST_CASE("AudioEngine stop twice produces one fade-out and one release", "[audio][engine]") {
    EngineFixture f;
    f.playToSteadyState();

    f.engine->stop();
    REQUIRE(f.status() == EngineStatus::FadingOut);
    const auto envelope = f.engine->activeEnvelope();
    REQUIRE(envelope.has_value());
    REQUIRE(envelope->startValue() == Approx(0.5f));
    REQUIRE(envelope->endValue() == Approx(0.0f));

    f.clock.advance(0.25);
    f.engine->stop();
    REQUIRE(f.status() == EngineStatus::FadingOut);
    REQUIRE(f.engine->activeEnvelope()->startTime() == Approx(envelope->startTime()));

    f.advance(1.0);
    REQUIRE(f.status() == EngineStatus::Stopped);
    REQUIRE(f.log->stopCalls == 1);
    REQUIRE(f.engine->currentGain() == Approx(0.0f));

    f.engine->stop();
    REQUIRE(f.status() == EngineStatus::Stopped);
    REQUIRE(f.log->stopCalls == 1);
}

TEST_CASE("AudioEngine stop during fade-in starts from the partial gain", "[audio][engine]") {
    EngineFixture f;
    f.engine->start();
    f.advance(0.8);
    REQUIRE(f.engine->currentGain() == Approx(0.2f));

    f.engine->stop();
    REQUIRE(f.status() == EngineStatus::FadingOut);
    const auto envelope = f.engine->activeEnvelope();
    REQUIRE(envelope.has_value());
    REQUIRE(envelope->startValue() == Approx(0.2f));
    REQUIRE(envelope->durationSeconds() == Approx(1.0));

    f.advance(0.5);
    REQUIRE(f.engine->currentGain() == Approx(0.1f));
}

TEST_CASE("AudioEngine start during fade-out reverses from the current gain", "[audio][engine]") {
    EngineFixture f;
    f.playToSteadyState();
    f.engine->stop();
    f.advance(0.5);
    REQUIRE(f.engine->currentGain() == Approx(0.25f));

    f.engine->start();
    REQUIRE(f.status() == EngineStatus::FadingIn);
    REQUIRE(f.engine->activeEnvelope()->startValue() == Approx(0.25f));
    REQUIRE(f.log->stopCalls == 0);

    f.advance(2.0);
    REQUIRE(f.status() == EngineStatus::Playing);
}

TEST_CASE("AudioEngine stop from idle does nothing", "[audio][engine]") {
    EngineFixture f;
    f.engine->initialize();
    f.engine->stop();
    REQUIRE(f.status() == EngineStatus::Idle);
    REQUIRE(f.log->stopCalls == 0);
}

TEST_CASE("AudioEngine interruption suspends without auto-resume", "[audio][engine]") {
    EngineFixture f;
    f.playToSteadyState();

    f.engine->onInterruption(true);
    REQUIRE(f.engine->state() == AudioEngineState::suspended(true));
    REQUIRE_FALSE(f.engine->isAudible());
    REQUIRE(f.engine->currentGain() == Approx(0.0f));

    f.engine->onInterruption(false, true);
    f.advance(30.0);
    REQUIRE(f.engine->state() == AudioEngineState::suspended(true));

    SECTION("explicit start fades back in") {
        f.engine->start();
        REQUIRE(f.status() == EngineStatus::FadingIn);
        REQUIRE(f.engine->activeEnvelope()->startValue() == Approx(0.0f));
        REQUIRE(f.log->startCalls == 1);
    }

    SECTION("stop while suspended releases immediately") {
        f.engine->stop();
        REQUIRE(f.status() == EngineStatus::Stopped);
        REQUIRE(f.log->stopCalls == 1);
    }
}

TEST_CASE("AudioEngine interruption that needs a restart reopens the stream", "[audio][engine]") {
    EngineFixture f;
    f.playToSteadyState();

    f.engine->onInterruption(true);
    f.engine->onInterruption(false, false);
    REQUIRE(f.engine->state() == AudioEngineState::suspended(false));

    f.engine->start();
    REQUIRE(f.status() == EngineStatus::FadingIn);
    REQUIRE(f.log->stopCalls == 1);
    REQUIRE(f.log->startCalls == 2);
}

TEST_CASE("AudioEngine interruption during fade-out stops", "[audio][engine]") {
    EngineFixture f;
    f.playToSteadyState();
    f.engine->stop();

    f.engine->onInterruption(true);
    REQUIRE(f.status() == EngineStatus::Stopped);
    REQUIRE(f.log->stopCalls == 1);
}

TEST_CASE("AudioEngine device failure degrades to Stopped", "[audio][engine]") {
    EngineFixture f;

    SECTION("output refuses to start") {
        f.log->failStart = true;
        f.engine->start();
        REQUIRE(f.status() == EngineStatus::Stopped);
        REQUIRE(f.log->closeCalls == 1);
        const auto error = f.engine->popError();
        REQUIRE(error.has_value());
        REQUIRE(error->code == ErrorCode::PlaybackFailed);
    }

    SECTION("failure reported while playing") {
        f.playToSteadyState();
        f.engine->reportDeviceFailure("device unplugged");
        REQUIRE(f.status() == EngineStatus::Stopped);
        REQUIRE(f.engine->currentGain() == Approx(0.0f));
        REQUIRE(f.engine->popError()->code == ErrorCode::PlaybackFailed);

        // A later start reacquires the device.
        f.engine->start();
        REQUIRE(f.status() == EngineStatus::FadingIn);
        REQUIRE(f.log->openCalls == 2);
    }
}

TEST_CASE("AudioEngine treats a device that stops calling back as a playback failure", "[audio][engine]") {
    EngineFixture f(0.0, 0.5);
    auto buffer = makeBuffer();

    SECTION("callbacks keep the engine playing") {
        f.engine->start();
        for (int i = 0; i < 30; ++i) {
            f.clock.advance(0.1);
            f.engine->audioOut(buffer);
            f.engine->update();
        }
        REQUIRE(f.status() == EngineStatus::Playing);
        REQUIRE_FALSE(f.engine->popError().has_value());
    }

    SECTION("silence from the device stops the engine") {
        f.engine->start();
        for (int i = 0; i < 25; ++i) {
            f.clock.advance(0.1);
            f.engine->audioOut(buffer);
            f.engine->update();
        }
        REQUIRE(f.status() == EngineStatus::Playing);

        f.clock.advance(0.6);
        f.engine->update();
        REQUIRE(f.status() == EngineStatus::Stopped);
        REQUIRE(f.engine->currentGain() == Approx(0.0f));
        REQUIRE(f.log->closeCalls == 1);
        const auto error = f.engine->popError();
        REQUIRE(error.has_value());
        REQUIRE(error->code == ErrorCode::PlaybackFailed);
    }

    SECTION("no check while not audible") {
        f.engine->initialize();
        f.advance(10.0);
        REQUIRE(f.status() == EngineStatus::Idle);
        REQUIRE_FALSE(f.engine->popError().has_value());
    }
}

TEST_CASE("AudioEngine setVolume", "[audio][engine]") {
    EngineFixture f;

    SECTION("applies immediately while playing") {
        f.playToSteadyState();
        f.engine->setVolume(0.8f);
        REQUIRE(f.engine->currentGain() == Approx(0.8f));
    }

    SECTION("during fade-in glides to the new target after the fade") {
        f.engine->start();
        f.advance(1.0);
        f.engine->setVolume(0.3f);
        REQUIRE(f.engine->activeEnvelope()->endValue() == Approx(0.5f));

        f.advance(1.0);
        REQUIRE(f.status() == EngineStatus::FadingIn);
        REQUIRE(f.engine->currentGain() == Approx(0.5f));

        f.advance(0.125);
        REQUIRE(f.engine->currentGain() == Approx(0.4f));

        f.advance(0.125);
        REQUIRE(f.status() == EngineStatus::Playing);
        REQUIRE(f.engine->currentGain() == Approx(0.3f));
        REQUIRE_FALSE(f.engine->activeEnvelope().has_value());
    }

    SECTION("during fade-in back to the same target needs no glide") {
        f.engine->start();
        f.advance(1.0);
        f.engine->setVolume(0.8f);
        f.engine->setVolume(0.5f);
        f.advance(1.0);
        REQUIRE(f.status() == EngineStatus::Playing);
        REQUIRE(f.engine->currentGain() == Approx(0.5f));
    }

    SECTION("is clamped to the unit range") {
        f.engine->setVolume(3.0f);
        REQUIRE(f.engine->targetVolume() == Approx(1.0f));
        f.engine->setVolume(-1.0f);
        REQUIRE(f.engine->targetVolume() == Approx(0.0f));
    }
}

TEST_CASE("AudioEngine renders silence unless audible", "[audio][engine][render]") {
    EngineFixture f;
    f.engine->initialize();
    auto buffer = makeBuffer();
    for (auto& sample : buffer.getBuffer()) {
        sample = 1.0f;
    }

    f.engine->audioOut(buffer);
    for (float sample : buffer.getBuffer()) {
        REQUIRE(sample == 0.0f);
    }
}

TEST_CASE("AudioEngine renders bounded noise at the held gain", "[audio][engine][render]") {
    SECTION("streaming") {
        EngineFixture f;
        f.playToSteadyState();
        auto buffer = makeBuffer(1024);
        f.engine->audioOut(buffer);

        const float bound = 0.35f * 0.5f;
        bool anyNonZero = false;
        const auto& samples = buffer.getBuffer();
        for (std::size_t frame = 0; frame < buffer.getNumFrames(); ++frame) {
            const float left = samples[frame * 2];
            const float right = samples[frame * 2 + 1];
            REQUIRE(std::abs(left) <= bound);
            REQUIRE(left == right);
            anyNonZero = anyNonZero || left != 0.0f;
        }
        REQUIRE(anyNonZero);
    }

    SECTION("looped buffer") {
        EngineFixture f(0.01);
        f.playToSteadyState();
        // 480 sample loop: frame 0 and frame 480 carry the same sample.
        auto buffer = makeBuffer(1024);
        f.engine->audioOut(buffer);
        const auto& samples = buffer.getBuffer();
        REQUIRE(samples[0] == samples[480 * 2]);
        REQUIRE(samples[2] == samples[481 * 2]);
    }
}
