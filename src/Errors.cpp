#include "Errors.h"

namespace bhvd {

std::string errorCodeToString(ErrorCode code) {
	switch (code) {
		case ErrorCode::DeviceUnavailable:
			return "DeviceUnavailable";
		case ErrorCode::PlaybackFailed:
			return "PlaybackFailed";
		case ErrorCode::AlreadyActive:
			return "AlreadyActive";
		case ErrorCode::InvalidTransition:
			return "InvalidTransition";
		case ErrorCode::InvalidConfig:
			return "InvalidConfig";
		case ErrorCode::SyncFailed:
			return "SyncFailed";
		case ErrorCode::CorruptLocalState:
			return "CorruptLocalState";
		case ErrorCode::PersistenceFailed:
			return "PersistenceFailed";
	}
	return "Unknown";
}

SessionError::SessionError(ErrorCode code, const std::string& message)
	: std::runtime_error(errorCodeToString(code) + ": " + message)
	, code_(code) {}

}  // namespace bhvd
