#pragma once

#include "SessionController.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace bhvd::infra {

class PhaseTransitionLogger {
  public:
	struct TransitionRecord {
		uint64_t timestampMicros = 0;
		std::string sessionId;
		SessionPhase phaseFrom = SessionPhase::Idle;
		SessionPhase phaseTo = SessionPhase::Idle;
		std::int64_t elapsedSec = 0;
		std::string trigger;   // start / tick / abort
	};

	static TransitionRecord fromEvent(const SessionController::PhaseEvent& event, const std::string& sessionId);

	void setup(const std::filesystem::path& csvPath);
	void recordTransition(const TransitionRecord& record);
	void flush();

	const std::filesystem::path& csvPath() const { return csvPath_; }

  private:
	void openIfNeeded();
	void ensureHeader();

	std::filesystem::path csvPath_;
	std::ofstream stream_;
	bool headerWritten_ = false;
};

}  // namespace bhvd::infra
