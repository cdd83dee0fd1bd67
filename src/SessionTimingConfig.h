#pragma once

#include "SessionController.h"

#include <filesystem>

namespace bhvd {

/// Phase thresholds read from config/session_timing.json. Test mode scales every
/// threshold so a full session can be rehearsed in minutes.
class SessionTimingConfig {
  public:
	static SessionTimingConfig load(const std::filesystem::path& relativePath);
	static SessionTimingConfig fromJson(const ofJson& json);

	[[nodiscard]] bool testModeEnabled() const noexcept { return testModeEnabled_; }
	[[nodiscard]] double testScaleFactor() const noexcept { return testScaleFactor_; }
	[[nodiscard]] const SessionConfig& baseConfig() const noexcept { return base_; }

	/// Base thresholds with test-mode scaling applied; falls back to the defaults if
	/// scaling collapses the ordering.
	[[nodiscard]] SessionConfig effectiveConfig() const;

  private:
	SessionConfig base_{};
	bool testModeEnabled_ = false;
	double testScaleFactor_ = 1.0;
};

}  // namespace bhvd
