#pragma once

#include "AudioOutput.h"
#include "GainEnvelope.h"
#include "NoiseGenerator.h"

#include "Errors.h"

#include "ofSoundBaseTypes.h"
#include "ofSoundBuffer.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bhvd::audio {

enum class EngineStatus : std::uint8_t {
    Uninitialized = 0,
    Idle,
    FadingIn,
    Playing,
    FadingOut,
    Stopped,
    Suspended
};

/// Engine state as a tagged value: `resumable` carries the Suspended payload and is
/// false for every other status.
struct AudioEngineState {
    EngineStatus status = EngineStatus::Uninitialized;
    bool resumable = false;

    static AudioEngineState of(EngineStatus status) { return {status, false}; }
    static AudioEngineState suspended(bool resumable) { return {EngineStatus::Suspended, resumable}; }

    bool operator==(const AudioEngineState& other) const {
        return status == other.status && resumable == other.resumable;
    }
    bool operator!=(const AudioEngineState& other) const { return !(*this == other); }
};

std::string engineStatusToString(EngineStatus status);
std::string engineStateToString(const AudioEngineState& state);

struct AudioEngineSettings {
    AudioOutputSettings output{};
    float targetVolume = 0.5f;
    double fadeInSeconds = 2.0;
    double fadeOutSeconds = 1.0;
    double loopSeconds = 0.0;   // 0 streams from the generator, > 0 loops a pre-rendered buffer
    NoiseParameters noise{};
    std::uint32_t seed = 0;     // 0 draws a seed from std::random_device
    double callbackTimeoutSeconds = 0.5;    // <= 0 disables the stalled-device check
};

struct EngineError {
    ErrorCode code = ErrorCode::PlaybackFailed;
    std::string message;
    double timestamp = 0.0;
};

/// Owns the noise bed: device lifecycle, the single gain envelope and interruption
/// handling. Control methods are called from one thread; audioOut() runs on the
/// device thread and only reads a snapshot taken under mutex_.
class AudioEngine : public ofBaseSoundOutput {
public:
    /// Monotonic seconds; envelopes are scheduled and evaluated on this clock.
    using Clock = std::function<double()>;

    AudioEngine(std::unique_ptr<AudioOutput> output, AudioEngineSettings settings, Clock clock);
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();
    void start();
    void stop();
    void setVolume(float target);
    void onInterruption(bool begin, bool shouldResume = true);

    /// Applies timed transitions: fade-in completion and release after fade-out. While
    /// audible, a device that stops calling audioOut() for longer than the callback
    /// timeout is treated as a playback failure.
    void update();
    void reportDeviceFailure(const std::string& reason);

    void audioOut(ofSoundBuffer& buffer) override;

    AudioEngineState state() const;
    float currentGain() const;
    float targetVolume() const;
    std::optional<GainEnvelope> activeEnvelope() const;
    bool isAudible() const;
    std::optional<EngineError> popError();

    const AudioEngineSettings& settings() const { return settings_; }
    std::string deviceName() const { return output_->describe(); }

private:
    bool ensureOutputRunning();
    void scheduleEnvelopeLocked(float endValue, double durationSeconds, double nowSeconds);
    float gainAtLocked(double nowSeconds) const;
    double callbackTimeout() const;
    void failPlayback(const std::string& reason);
    void pushError(ErrorCode code, const std::string& message);
    void prepareRenderBuffers();
    float nextSample();

    std::unique_ptr<AudioOutput> output_;
    AudioEngineSettings settings_;
    Clock clock_;
    NoiseGenerator generator_;

    // Shared with the device thread.
    mutable std::mutex mutex_;
    AudioEngineState state_{};
    std::optional<GainEnvelope> envelope_;
    float heldGain_ = 0.0f;
    float targetVolume_ = 0.5f;
    std::atomic<double> lastCallbackAt_{0.0};

    // Device thread only once the stream runs.
    BrownNoiseState noiseState_{};
    WhiteNoiseSource whiteSource_;
    std::vector<float> loopBuffer_;
    std::size_t loopCursor_ = 0;

    std::deque<EngineError> errors_;
};

} // namespace bhvd::audio
