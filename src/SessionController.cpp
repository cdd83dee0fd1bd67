#include "SessionController.h"

#include "Errors.h"
#include "audio/AudioEngine.h"

#include "ofMain.h"

#include <algorithm>
#include <cstdio>

namespace bhvd {

std::string sessionPhaseToString(SessionPhase phase) {
	switch (phase) {
		case SessionPhase::Idle:
			return "Idle";
		case SessionPhase::Entry:
			return "Entry";
		case SessionPhase::Immersion:
			return "Immersion";
		case SessionPhase::Return:
			return "Return";
		case SessionPhase::Completed:
			return "Completed";
		case SessionPhase::Aborted:
			return "Aborted";
	}
	return "Unknown";
}

std::optional<SessionPhase> sessionPhaseFromString(const std::string& value) {
	const std::string lower = ofToLower(value);
	if (lower == "idle") {
		return SessionPhase::Idle;
	}
	if (lower == "entry") {
		return SessionPhase::Entry;
	}
	if (lower == "immersion") {
		return SessionPhase::Immersion;
	}
	if (lower == "return") {
		return SessionPhase::Return;
	}
	if (lower == "completed") {
		return SessionPhase::Completed;
	}
	if (lower == "aborted") {
		return SessionPhase::Aborted;
	}
	return std::nullopt;
}

std::string phaseGuidance(SessionPhase phase) {
	switch (phase) {
		case SessionPhase::Entry:
			return "Prepare your mind...";
		case SessionPhase::Immersion:
			return "Focus on the sound...";
		case SessionPhase::Return:
			return "Gently come back...";
		default:
			return "";
	}
}

std::string formatClock(std::int64_t seconds) {
	seconds = std::max<std::int64_t>(seconds, 0);
	char text[32];
	std::snprintf(text, sizeof(text), "%02lld:%02lld", static_cast<long long>(seconds / 60),
	              static_cast<long long>(seconds % 60));
	return text;
}

bool SessionConfig::isValid() const noexcept {
	return entryEndSeconds > 0 && entryEndSeconds < immersionEndSeconds &&
	       immersionEndSeconds < totalDurationSeconds;
}

SessionPhase phaseForElapsed(const SessionConfig& config, std::int64_t elapsedSeconds) noexcept {
	if (elapsedSeconds < config.entryEndSeconds) {
		return SessionPhase::Entry;
	}
	if (elapsedSeconds < config.immersionEndSeconds) {
		return SessionPhase::Immersion;
	}
	if (elapsedSeconds < config.totalDurationSeconds) {
		return SessionPhase::Return;
	}
	return SessionPhase::Completed;
}

SessionController::SessionController(audio::AudioEngine& engine, WallClock clock)
	: engine_(engine)
	, clock_(std::move(clock)) {}

bool SessionController::isActive() const noexcept {
	return phase_ == SessionPhase::Entry || phase_ == SessionPhase::Immersion || phase_ == SessionPhase::Return;
}

void SessionController::start(const SessionConfig& config, SessionSource source) {
	if (isActive()) {
		throw SessionError(ErrorCode::AlreadyActive,
		                   "session already running in phase " + sessionPhaseToString(phase_));
	}
	if (!config.isValid()) {
		throw SessionError(ErrorCode::InvalidConfig, "thresholds must satisfy 0 < entryEnd < immersionEnd < total");
	}

	const auto now = clock_();
	config_ = config;
	source_ = source;
	sessionStartedAt_ = now;
	segmentStartedAt_ = now;
	accumulatedBeforePause_ = {};
	elapsedHighWater_ = 0;
	finalElapsed_ = 0;
	paused_ = false;
	interrupted_ = false;

	pushPhaseEvent(phase_, SessionPhase::Entry, 0, "start", now);
	phase_ = SessionPhase::Entry;

	if (audioEnabled_) {
		engine_.start();
	}
	ofLogNotice("SessionController") << "Session started (" << sessionSourceToString(source) << ") total="
	                                 << config_.totalDurationSeconds << "s entryEnd=" << config_.entryEndSeconds
	                                 << "s immersionEnd=" << config_.immersionEndSeconds << "s";
}

void SessionController::pause() {
	requireActive("pause");
	if (paused_) {
		return;
	}
	freezeClock(clock_());
	paused_ = true;
	engine_.stop();
	ofLogNotice("SessionController") << "Paused at " << elapsedSeconds() << "s";
}

void SessionController::resume() {
	requireActive("resume");
	if (!paused_) {
		return;
	}
	segmentStartedAt_ = clock_();
	paused_ = false;
	interrupted_ = false;
	if (audioEnabled_) {
		engine_.start();
	}
	ofLogNotice("SessionController") << "Resumed at " << elapsedSeconds() << "s";
}

void SessionController::abort() {
	requireActive("abort");

	// A session that ran out while nobody ticked is recorded as completed, not aborted.
	tick();
	if (!isActive()) {
		return;
	}

	const auto now = clock_();
	const std::int64_t elapsed = computeElapsed(now);
	engine_.stop();
	emitRecord(elapsed, false, now);

	pushPhaseEvent(phase_, SessionPhase::Aborted, elapsed, "abort", now);
	pushPhaseEvent(SessionPhase::Aborted, SessionPhase::Idle, elapsed, "abort", now);
	phase_ = SessionPhase::Idle;
	paused_ = false;
	interrupted_ = false;
	finalElapsed_ = 0;
	ofLogNotice("SessionController") << "Session aborted at " << elapsed << "s";
}

void SessionController::tick() {
	if (!isActive()) {
		return;
	}
	const auto now = clock_();
	const std::int64_t elapsed = computeElapsed(now);
	advanceTo(phaseForElapsed(config_, elapsed), elapsed, "tick", now);
}

void SessionController::onInterruption(bool begin, bool shouldResume) {
	engine_.onInterruption(begin, shouldResume);
	if (!isActive()) {
		return;
	}
	if (begin) {
		if (paused_) {
			return;
		}
		freezeClock(clock_());
		paused_ = true;
		interrupted_ = true;
		ofLogNotice("SessionController") << "Interrupted at " << elapsedSeconds() << "s, waiting for resume";
	} else {
		ofLogNotice("SessionController") << "Interruption ended, waiting for resume";
	}
}

void SessionController::setAudioEnabled(bool enabled) {
	if (audioEnabled_ == enabled) {
		return;
	}
	audioEnabled_ = enabled;
	if (!isActive() || paused_) {
		return;
	}
	if (enabled) {
		engine_.start();
	} else {
		engine_.stop();
	}
}

std::optional<SessionRecord> SessionController::popRecord() {
	if (records_.empty()) {
		return std::nullopt;
	}
	SessionRecord record = records_.front();
	records_.pop_front();
	return record;
}

std::optional<SessionController::PhaseEvent> SessionController::popPhaseEvent() {
	if (phaseEvents_.empty()) {
		return std::nullopt;
	}
	PhaseEvent event = phaseEvents_.front();
	phaseEvents_.pop_front();
	return event;
}

std::int64_t SessionController::elapsedSeconds() const {
	if (!isActive()) {
		return finalElapsed_;
	}
	return computeElapsed(clock_());
}

std::int64_t SessionController::remainingSeconds() const {
	return std::max<std::int64_t>(config_.totalDurationSeconds - elapsedSeconds(), 0);
}

std::int64_t SessionController::computeElapsed(std::chrono::system_clock::time_point now) const {
	auto total = accumulatedBeforePause_;
	if (!paused_) {
		const auto delta = now - segmentStartedAt_;
		if (delta.count() > 0) {
			total += delta;
		}
	}
	const std::int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(total).count();
	// A wall clock stepped backwards must not move the session backwards.
	elapsedHighWater_ = std::max(elapsedHighWater_, seconds);
	return elapsedHighWater_;
}

void SessionController::freezeClock(std::chrono::system_clock::time_point now) {
	const auto delta = now - segmentStartedAt_;
	if (delta.count() > 0) {
		accumulatedBeforePause_ += delta;
	}
	segmentStartedAt_ = now;
}

void SessionController::advanceTo(SessionPhase target, std::int64_t elapsed, const std::string& trigger,
                                  std::chrono::system_clock::time_point now) {
	while (phase_ < target) {
		const SessionPhase next = static_cast<SessionPhase>(static_cast<std::uint8_t>(phase_) + 1);
		pushPhaseEvent(phase_, next, elapsed, trigger, now);
		phase_ = next;
	}

	if (phase_ != SessionPhase::Completed) {
		return;
	}

	engine_.stop();
	paused_ = false;
	interrupted_ = false;
	finalElapsed_ = config_.totalDurationSeconds;
	emitRecord(config_.totalDurationSeconds, true, now);
	ofLogNotice("SessionController") << "Session completed after " << formatClock(config_.totalDurationSeconds);
}

void SessionController::pushPhaseEvent(SessionPhase from, SessionPhase to, std::int64_t elapsed,
                                       const std::string& trigger, std::chrono::system_clock::time_point now) {
	PhaseEvent event;
	event.from = from;
	event.to = to;
	event.elapsedSeconds = elapsed;
	event.trigger = trigger;
	event.timestamp = now;
	phaseEvents_.push_back(event);
}

void SessionController::emitRecord(std::int64_t elapsed, bool completed, std::chrono::system_clock::time_point now) {
	SessionRecord record;
	record.id = nextRecordId(now);
	record.startedAt = sessionStartedAt_;
	record.elapsedSeconds = std::max<std::int64_t>(elapsed, 0);
	record.completed = completed;
	record.source = source_;
	record.syncState = {};
	records_.push_back(record);
}

void SessionController::reserveRecordIdsThrough(std::int64_t id) {
	lastRecordId_ = std::max(lastRecordId_, id);
}

std::string SessionController::nextRecordId(std::chrono::system_clock::time_point now) {
	std::int64_t millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
	if (millis <= lastRecordId_) {
		millis = lastRecordId_ + 1;
	}
	lastRecordId_ = millis;
	return std::to_string(millis);
}

void SessionController::requireActive(const char* operation) const {
	if (!isActive()) {
		throw SessionError(ErrorCode::InvalidTransition,
		                   std::string(operation) + " requires an active session (phase " +
		                       sessionPhaseToString(phase_) + ")");
	}
}

}  // namespace bhvd
