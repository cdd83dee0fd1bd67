#include "AudioEngine.h"

#include "Utility.h"

#include "ofLog.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace bhvd::audio {

namespace {

constexpr double kVolumeGlideSeconds = 0.25;

} // namespace

std::string engineStatusToString(EngineStatus status) {
    switch (status) {
        case EngineStatus::Uninitialized:
            return "Uninitialized";
        case EngineStatus::Idle:
            return "Idle";
        case EngineStatus::FadingIn:
            return "FadingIn";
        case EngineStatus::Playing:
            return "Playing";
        case EngineStatus::FadingOut:
            return "FadingOut";
        case EngineStatus::Stopped:
            return "Stopped";
        case EngineStatus::Suspended:
            return "Suspended";
    }
    return "Unknown";
}

std::string engineStateToString(const AudioEngineState& state) {
    if (state.status == EngineStatus::Suspended) {
        return state.resumable ? "Suspended(resumable)" : "Suspended(restart)";
    }
    return engineStatusToString(state.status);
}

AudioEngine::AudioEngine(std::unique_ptr<AudioOutput> output, AudioEngineSettings settings, Clock clock)
    : output_(std::move(output))
    , settings_(std::move(settings))
    , clock_(std::move(clock))
    , generator_(settings_.noise) {
    settings_.targetVolume = clamp01(settings_.targetVolume);
    settings_.fadeInSeconds = std::max(settings_.fadeInSeconds, 0.0);
    settings_.fadeOutSeconds = std::max(settings_.fadeOutSeconds, 0.0);
    targetVolume_ = settings_.targetVolume;
    whiteSource_.seed(settings_.seed != 0 ? settings_.seed : std::random_device{}());
}

AudioEngine::~AudioEngine() {
    // The device thread calls back into this object; stop it before members go away.
    output_->close();
}

bool AudioEngine::initialize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.status != EngineStatus::Uninitialized) {
            return true;
        }
    }

    prepareRenderBuffers();
    if (!output_->open(settings_.output, this)) {
        pushError(ErrorCode::DeviceUnavailable, "no audio output could be acquired");
        ofLogWarning("AudioEngine") << "Audio output unavailable, session continues silently";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = AudioEngineState::of(EngineStatus::Idle);
    ofLogNotice("AudioEngine") << "Initialised on '" << output_->describe() << "'";
    return true;
}

void AudioEngine::prepareRenderBuffers() {
    noiseState_ = {};
    loopCursor_ = 0;
    loopBuffer_.clear();
    const std::size_t loopSamples = secondsToSamples(settings_.loopSeconds, settings_.output.sampleRate);
    if (loopSamples > 0) {
        loopBuffer_.assign(loopSamples, 0.0f);
        noiseState_ = generator_.generateBlock(noiseState_, whiteSource_, loopBuffer_.data(), loopBuffer_.size());
        ofLogVerbose("AudioEngine") << "Rendered " << loopSamples << " sample loop buffer";
    }
}

bool AudioEngine::ensureOutputRunning() {
    if (!output_->isOpen() && !output_->open(settings_.output, this)) {
        pushError(ErrorCode::DeviceUnavailable, "audio output could not be reopened");
        ofLogWarning("AudioEngine") << "Audio output unavailable, session continues silently";
        return false;
    }
    if (!output_->isRunning() && !output_->start()) {
        failPlayback("audio output refused to start");
        return false;
    }
    return true;
}

void AudioEngine::start() {
    update();

    AudioEngineState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = state_;
    }

    switch (current.status) {
        case EngineStatus::FadingIn:
        case EngineStatus::Playing:
            return;
        case EngineStatus::Uninitialized:
            if (!initialize()) {
                return;
            }
            [[fallthrough]];
        case EngineStatus::Idle:
        case EngineStatus::Stopped: {
            if (!ensureOutputRunning()) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            heldGain_ = 0.0f;
            envelope_.reset();
            scheduleEnvelopeLocked(targetVolume_, settings_.fadeInSeconds, clock_());
            state_ = AudioEngineState::of(EngineStatus::FadingIn);
            break;
        }
        case EngineStatus::FadingOut: {
            // Reverse from wherever the fade-out has reached; the stream is still running.
            std::lock_guard<std::mutex> lock(mutex_);
            scheduleEnvelopeLocked(targetVolume_, settings_.fadeInSeconds, clock_());
            state_ = AudioEngineState::of(EngineStatus::FadingIn);
            break;
        }
        case EngineStatus::Suspended: {
            if (!current.resumable) {
                output_->stop();
            }
            if (!ensureOutputRunning()) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            scheduleEnvelopeLocked(targetVolume_, settings_.fadeInSeconds, clock_());
            state_ = AudioEngineState::of(EngineStatus::FadingIn);
            break;
        }
    }
    lastCallbackAt_.store(clock_());
    ofLogVerbose("AudioEngine") << "Fade in to " << targetVolume() << " over " << settings_.fadeInSeconds << "s";
}

void AudioEngine::stop() {
    update();

    bool releaseNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_.status) {
            case EngineStatus::Uninitialized:
            case EngineStatus::Idle:
            case EngineStatus::Stopped:
            case EngineStatus::FadingOut:
                return;
            case EngineStatus::FadingIn:
            case EngineStatus::Playing:
                scheduleEnvelopeLocked(0.0f, settings_.fadeOutSeconds, clock_());
                state_ = AudioEngineState::of(EngineStatus::FadingOut);
                break;
            case EngineStatus::Suspended:
                // Already muted: nothing to fade.
                envelope_.reset();
                heldGain_ = 0.0f;
                state_ = AudioEngineState::of(EngineStatus::Stopped);
                releaseNow = true;
                break;
        }
    }

    if (releaseNow) {
        output_->stop();
        ofLogVerbose("AudioEngine") << "Stopped from suspension";
        return;
    }
    ofLogVerbose("AudioEngine") << "Fade out over " << settings_.fadeOutSeconds << "s";
    update();
}

void AudioEngine::setVolume(float target) {
    std::lock_guard<std::mutex> lock(mutex_);
    targetVolume_ = clamp01(target);
    if (state_.status == EngineStatus::Playing && !envelope_.has_value()) {
        heldGain_ = targetVolume_;
    }
}

void AudioEngine::onInterruption(bool begin, bool shouldResume) {
    bool release = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (begin) {
            switch (state_.status) {
                case EngineStatus::FadingIn:
                case EngineStatus::Playing:
                    envelope_.reset();
                    heldGain_ = 0.0f;
                    state_ = AudioEngineState::suspended(true);
                    break;
                case EngineStatus::FadingOut:
                    envelope_.reset();
                    heldGain_ = 0.0f;
                    state_ = AudioEngineState::of(EngineStatus::Stopped);
                    release = true;
                    break;
                default:
                    return;
            }
        } else {
            if (state_.status != EngineStatus::Suspended) {
                return;
            }
            state_.resumable = shouldResume;
        }
    }

    if (release) {
        output_->stop();
        ofLogNotice("AudioEngine") << "Interruption during fade out, stopped";
        return;
    }
    if (begin) {
        ofLogNotice("AudioEngine") << "Interruption began, muted and suspended";
    } else {
        ofLogNotice("AudioEngine") << "Interruption ended (" << (shouldResume ? "resumable" : "needs restart")
                                   << "), waiting for explicit start";
    }
}

void AudioEngine::update() {
    bool release = false;
    bool stalled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const double now = clock_();
        const bool audible = state_.status == EngineStatus::FadingIn || state_.status == EngineStatus::Playing ||
                             state_.status == EngineStatus::FadingOut;
        const double timeout = callbackTimeout();
        if (audible && timeout > 0.0 && now - lastCallbackAt_.load() > timeout) {
            stalled = true;
        } else if (envelope_.has_value() && envelope_->isComplete(now)) {
            if (state_.status == EngineStatus::FadingIn) {
                const float reached = envelope_->endValue();
                if (std::abs(reached - targetVolume_) > 1e-4f) {
                    // Volume changed during the fade: glide to it rather than step.
                    envelope_ = GainEnvelope(reached, targetVolume_, now, kVolumeGlideSeconds);
                } else {
                    envelope_.reset();
                    heldGain_ = targetVolume_;
                    state_ = AudioEngineState::of(EngineStatus::Playing);
                }
            } else if (state_.status == EngineStatus::FadingOut) {
                envelope_.reset();
                heldGain_ = 0.0f;
                state_ = AudioEngineState::of(EngineStatus::Stopped);
                release = true;
            }
        }
    }

    if (stalled) {
        failPlayback("audio device stopped requesting buffers");
        return;
    }
    if (release) {
        output_->stop();
        ofLogVerbose("AudioEngine") << "Fade out complete, stream released";
    }
}

void AudioEngine::reportDeviceFailure(const std::string& reason) {
    failPlayback(reason);
}

void AudioEngine::failPlayback(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        envelope_.reset();
        heldGain_ = 0.0f;
        if (state_.status != EngineStatus::Uninitialized) {
            state_ = AudioEngineState::of(EngineStatus::Stopped);
        }
    }
    output_->close();
    pushError(ErrorCode::PlaybackFailed, reason);
    ofLogError("AudioEngine") << "Playback failed: " << reason;
}

void AudioEngine::scheduleEnvelopeLocked(float endValue, double durationSeconds, double nowSeconds) {
    const float from = gainAtLocked(nowSeconds);
    envelope_ = GainEnvelope(from, endValue, nowSeconds, durationSeconds);
}

float AudioEngine::gainAtLocked(double nowSeconds) const {
    return envelope_.has_value() ? envelope_->valueAt(nowSeconds) : heldGain_;
}

double AudioEngine::callbackTimeout() const {
    if (settings_.callbackTimeoutSeconds <= 0.0) {
        return 0.0;
    }
    const double bufferPeriod = settings_.output.sampleRate > 0.0
                                    ? static_cast<double>(settings_.output.bufferSize) / settings_.output.sampleRate
                                    : 0.0;
    return std::max(settings_.callbackTimeoutSeconds, 3.0 * bufferPeriod);
}

void AudioEngine::pushError(ErrorCode code, const std::string& message) {
    errors_.push_back({code, message, clock_()});
    if (errors_.size() > 32) {
        errors_.pop_front();
    }
}

float AudioEngine::nextSample() {
    if (!loopBuffer_.empty()) {
        const float sample = loopBuffer_[loopCursor_];
        loopCursor_ = (loopCursor_ + 1) % loopBuffer_.size();
        return sample;
    }
    const NoiseStep step = generator_.next(noiseState_, whiteSource_);
    noiseState_ = step.state;
    return step.sample;
}

void AudioEngine::audioOut(ofSoundBuffer& buffer) {
    lastCallbackAt_.store(clock_());
    const auto numFrames = buffer.getNumFrames();
    const auto numChannels = buffer.getNumChannels();
    if (numFrames == 0 || numChannels == 0) {
        return;
    }

    std::optional<GainEnvelope> envelope;
    float heldGain = 0.0f;
    bool audible = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        audible = state_.status == EngineStatus::FadingIn || state_.status == EngineStatus::Playing ||
                  state_.status == EngineStatus::FadingOut;
        envelope = envelope_;
        heldGain = heldGain_;
    }

    float* output = buffer.getBuffer().data();
    if (!audible) {
        std::fill(output, output + numFrames * numChannels, 0.0f);
        return;
    }

    const double blockStart = clock_();
    const double sampleRate = buffer.getSampleRate() > 0 ? static_cast<double>(buffer.getSampleRate())
                                                         : settings_.output.sampleRate;
    for (std::size_t frame = 0; frame < numFrames; ++frame) {
        const double t = blockStart + static_cast<double>(frame) / sampleRate;
        const float gain = envelope.has_value() ? envelope->valueAt(t) : heldGain;
        const float sample = nextSample() * gain;
        for (std::size_t ch = 0; ch < numChannels; ++ch) {
            output[frame * numChannels + ch] = sample;
        }
    }
}

AudioEngineState AudioEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

float AudioEngine::currentGain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gainAtLocked(clock_());
}

float AudioEngine::targetVolume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targetVolume_;
}

std::optional<GainEnvelope> AudioEngine::activeEnvelope() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return envelope_;
}

bool AudioEngine::isAudible() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.status == EngineStatus::FadingIn || state_.status == EngineStatus::Playing ||
           state_.status == EngineStatus::FadingOut;
}

std::optional<EngineError> AudioEngine::popError() {
    if (errors_.empty()) {
        return std::nullopt;
    }
    EngineError error = errors_.front();
    errors_.pop_front();
    return error;
}

} // namespace bhvd::audio
