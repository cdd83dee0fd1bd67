#pragma once

#include "SessionRecord.h"
#include "SessionSource.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace bhvd {

namespace audio {
class AudioEngine;
}

enum class SessionPhase : std::uint8_t {
	Idle = 0,
	Entry,
	Immersion,
	Return,
	Completed,
	Aborted
};

std::string sessionPhaseToString(SessionPhase phase);
std::optional<SessionPhase> sessionPhaseFromString(const std::string& value);

/// On-screen prompt for a phase; empty for phases without one.
std::string phaseGuidance(SessionPhase phase);

/// mm:ss, minutes not wrapped at 60.
std::string formatClock(std::int64_t seconds);

struct SessionConfig {
	std::int64_t totalDurationSeconds = 20 * 60;
	std::int64_t entryEndSeconds = 2 * 60;
	std::int64_t immersionEndSeconds = 18 * 60;

	/// 0 < entryEnd < immersionEnd < total
	bool isValid() const noexcept;
};

/// Thresholds are inclusive below and exclusive above.
SessionPhase phaseForElapsed(const SessionConfig& config, std::int64_t elapsedSeconds) noexcept;

class SessionController {
public:
	using WallClock = std::function<std::chrono::system_clock::time_point()>;

	struct PhaseEvent {
		SessionPhase from = SessionPhase::Idle;
		SessionPhase to = SessionPhase::Idle;
		std::int64_t elapsedSeconds = 0;
		std::string trigger;          // start / tick / abort
		std::chrono::system_clock::time_point timestamp{};
	};

	SessionController(audio::AudioEngine& engine, WallClock clock);

	/// Throws SessionError(AlreadyActive) while a session runs, SessionError(InvalidConfig)
	/// for thresholds that break ordering.
	void start(const SessionConfig& config, SessionSource source = SessionSource::Manual);
	void pause();
	void resume();
	void abort();
	void tick();

	/// Forwards an audio interruption and freezes the clock while it lasts.
	void onInterruption(bool begin, bool shouldResume = true);
	void setAudioEnabled(bool enabled);

	/// Record ids issued from now on are strictly greater than `id`.
	void reserveRecordIdsThrough(std::int64_t id);

	std::optional<SessionRecord> popRecord();
	std::optional<PhaseEvent> popPhaseEvent();

	SessionPhase phase() const noexcept { return phase_; }
	const SessionConfig& config() const noexcept { return config_; }
	bool isActive() const noexcept;
	bool isPaused() const noexcept { return paused_; }
	bool isSuspendedByInterruption() const noexcept { return interrupted_; }
	bool audioEnabled() const noexcept { return audioEnabled_; }
	SessionSource source() const noexcept { return source_; }
	std::chrono::system_clock::time_point startedAt() const noexcept { return sessionStartedAt_; }

	/// Recomputed from the wall clock on every call.
	std::int64_t elapsedSeconds() const;
	std::int64_t remainingSeconds() const;

private:
	std::int64_t computeElapsed(std::chrono::system_clock::time_point now) const;
	void freezeClock(std::chrono::system_clock::time_point now);
	void advanceTo(SessionPhase target, std::int64_t elapsed, const std::string& trigger,
	               std::chrono::system_clock::time_point now);
	void pushPhaseEvent(SessionPhase from, SessionPhase to, std::int64_t elapsed, const std::string& trigger,
	                    std::chrono::system_clock::time_point now);
	void emitRecord(std::int64_t elapsed, bool completed, std::chrono::system_clock::time_point now);
	std::string nextRecordId(std::chrono::system_clock::time_point now);
	void requireActive(const char* operation) const;

	audio::AudioEngine& engine_;
	WallClock clock_;

	SessionConfig config_{};
	SessionPhase phase_ = SessionPhase::Idle;
	SessionSource source_ = SessionSource::Manual;
	std::chrono::system_clock::time_point sessionStartedAt_{};
	std::chrono::system_clock::time_point segmentStartedAt_{};
	std::chrono::system_clock::duration accumulatedBeforePause_{};
	mutable std::int64_t elapsedHighWater_ = 0;
	std::int64_t finalElapsed_ = 0;
	bool paused_ = false;
	bool interrupted_ = false;
	bool audioEnabled_ = true;
	std::int64_t lastRecordId_ = 0;

	std::deque<PhaseEvent> phaseEvents_;
	std::deque<SessionRecord> records_;
};

}  // namespace bhvd
