#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bhvd {

enum class ErrorCode : std::uint8_t {
	DeviceUnavailable = 0,
	PlaybackFailed,
	AlreadyActive,
	InvalidTransition,
	InvalidConfig,
	SyncFailed,
	CorruptLocalState,
	PersistenceFailed
};

std::string errorCodeToString(ErrorCode code);

/// Raised for state-machine misuse and for local writes that did not land.
/// Audio and sync failures never surface through this type.
class SessionError : public std::runtime_error {
public:
	SessionError(ErrorCode code, const std::string& message);

	[[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
	ErrorCode code_;
};

}  // namespace bhvd
