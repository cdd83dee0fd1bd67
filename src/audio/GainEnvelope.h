#pragma once

#include <algorithm>

namespace bhvd::audio {

/// Linear gain ramp on the engine clock. One instance per channel is active at a time;
/// replacing it is how a pending ramp gets cancelled.
class GainEnvelope {
public:
    GainEnvelope() = default;
    GainEnvelope(float startValue, float endValue, double startTime, double durationSeconds)
        : startValue_(startValue)
        , endValue_(endValue)
        , startTime_(startTime)
        , duration_(std::max(durationSeconds, 0.0)) {}

    inline float valueAt(double timeSeconds) const {
        if (duration_ <= 0.0 || timeSeconds >= startTime_ + duration_) {
            return endValue_;
        }
        if (timeSeconds <= startTime_) {
            return startValue_;
        }
        const double ratio = (timeSeconds - startTime_) / duration_;
        return startValue_ + static_cast<float>(ratio) * (endValue_ - startValue_);
    }

    bool isComplete(double timeSeconds) const { return timeSeconds >= startTime_ + duration_; }

    float startValue() const { return startValue_; }
    float endValue() const { return endValue_; }
    double startTime() const { return startTime_; }
    double durationSeconds() const { return duration_; }
    double endTime() const { return startTime_ + duration_; }

private:
    float startValue_ = 0.0f;
    float endValue_ = 0.0f;
    double startTime_ = 0.0;
    double duration_ = 0.0;
};

} // namespace bhvd::audio
