#include "infra/PhaseTransitionLogger.h"

#include "ofMain.h"

#include <chrono>

namespace bhvd::infra {

namespace {

std::filesystem::path makeAbsolute(const std::filesystem::path& path) {
	if (path.is_absolute()) {
		return path;
	}
	return std::filesystem::absolute(std::filesystem::current_path() / path);
}

}  // namespace

PhaseTransitionLogger::TransitionRecord PhaseTransitionLogger::fromEvent(const SessionController::PhaseEvent& event,
                                                                         const std::string& sessionId) {
	TransitionRecord record;
	record.timestampMicros = static_cast<uint64_t>(
		std::chrono::duration_cast<std::chrono::microseconds>(event.timestamp.time_since_epoch()).count());
	record.sessionId = sessionId;
	record.phaseFrom = event.from;
	record.phaseTo = event.to;
	record.elapsedSec = event.elapsedSeconds;
	record.trigger = event.trigger;
	return record;
}

void PhaseTransitionLogger::setup(const std::filesystem::path& csvPath) {
	if (stream_.is_open()) {
		stream_.close();
	}
	csvPath_ = makeAbsolute(csvPath);
	std::error_code ec;
	std::filesystem::create_directories(csvPath_.parent_path(), ec);
	if (ec) {
		ofLogWarning("PhaseTransitionLogger") << "Failed to create directory: " << ec.message();
	}
	openIfNeeded();
	ensureHeader();
}

void PhaseTransitionLogger::recordTransition(const TransitionRecord& record) {
	openIfNeeded();
	ensureHeader();
	if (!stream_.is_open()) {
		return;
	}
	stream_ << record.timestampMicros << ','
	        << record.sessionId << ','
	        << sessionPhaseToString(record.phaseFrom) << ','
	        << sessionPhaseToString(record.phaseTo) << ','
	        << record.elapsedSec << ','
	        << record.trigger << '\n';
	stream_.flush();
}

void PhaseTransitionLogger::flush() {
	if (stream_.is_open()) {
		stream_.flush();
	}
}

void PhaseTransitionLogger::openIfNeeded() {
	if (stream_.is_open() || csvPath_.empty()) {
		return;
	}
	std::error_code ec;
	const auto initialSize = std::filesystem::exists(csvPath_, ec) ? std::filesystem::file_size(csvPath_, ec) : 0;
	stream_.open(csvPath_, std::ios::app);
	if (!stream_) {
		ofLogError("PhaseTransitionLogger") << "Failed to open csv: " << csvPath_;
		return;
	}
	headerWritten_ = (initialSize > 0);
}

void PhaseTransitionLogger::ensureHeader() {
	if (!stream_.is_open() || headerWritten_) {
		return;
	}
	stream_ << "timestampMicros,sessionId,phaseFrom,phaseTo,elapsedSec,trigger\n";
	headerWritten_ = true;
}

}  // namespace bhvd::infra
