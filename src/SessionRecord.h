#pragma once

#include "SessionSource.h"

#include "ofJson.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace bhvd {

enum class SyncStatus : std::uint8_t {
	Pending = 0,
	Synced,
	Failed
};

std::string syncStatusToString(SyncStatus status);
std::optional<SyncStatus> syncStatusFromString(const std::string& value);

/// Failed carries retryCount; Pending and Synced keep the count of earlier failures.
struct SyncState {
	SyncStatus status = SyncStatus::Pending;
	std::uint32_t retryCount = 0;

	bool needsSync() const noexcept { return status != SyncStatus::Synced; }
};

struct SessionRecord {
	std::string id;
	std::chrono::system_clock::time_point startedAt{};
	std::int64_t elapsedSeconds = 0;
	bool completed = false;
	SessionSource source = SessionSource::Manual;
	SyncState syncState{};
};

std::string toIso8601(const std::chrono::system_clock::time_point& tp);
std::optional<std::chrono::system_clock::time_point> fromIso8601(const std::string& text);

ofJson sessionRecordToJson(const SessionRecord& record);

/// Accepts startedAt either as ISO-8601 UTC or epoch seconds. Returns nullopt when a
/// required field is missing or out of range.
std::optional<SessionRecord> sessionRecordFromJson(const ofJson& json);

}  // namespace bhvd
