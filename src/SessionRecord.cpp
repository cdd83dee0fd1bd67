#include "SessionRecord.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace bhvd {

std::string syncStatusToString(SyncStatus status) {
	switch (status) {
		case SyncStatus::Pending:
			return "pending";
		case SyncStatus::Synced:
			return "synced";
		case SyncStatus::Failed:
			return "failed";
	}
	return "pending";
}

std::optional<SyncStatus> syncStatusFromString(const std::string& value) {
	if (value == "pending") {
		return SyncStatus::Pending;
	}
	if (value == "synced") {
		return SyncStatus::Synced;
	}
	if (value == "failed") {
		return SyncStatus::Failed;
	}
	return std::nullopt;
}

std::string toIso8601(const std::chrono::system_clock::time_point& tp) {
	const auto tt = std::chrono::system_clock::to_time_t(tp);
	std::tm tm {};
#if defined(_WIN32)
	gmtime_s(&tm, &tt);
#else
	gmtime_r(&tt, &tm);
#endif
	std::ostringstream oss;
	oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
	return oss.str();
}

std::optional<std::chrono::system_clock::time_point> fromIso8601(const std::string& text) {
	std::tm tm {};
	std::istringstream iss(text);
	iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
	if (iss.fail()) {
		return std::nullopt;
	}
#if defined(_WIN32)
	const std::time_t tt = _mkgmtime(&tm);
#else
	const std::time_t tt = timegm(&tm);
#endif
	if (tt == static_cast<std::time_t>(-1)) {
		return std::nullopt;
	}
	return std::chrono::system_clock::from_time_t(tt);
}

ofJson sessionRecordToJson(const SessionRecord& record) {
	return ofJson{
		{"id", record.id},
		{"startedAt", toIso8601(record.startedAt)},
		{"elapsedSeconds", record.elapsedSeconds},
		{"completed", record.completed},
		{"source", sessionSourceToString(record.source)},
		{"syncState", syncStatusToString(record.syncState.status)},
		{"retryCount", record.syncState.retryCount},
	};
}

std::optional<SessionRecord> sessionRecordFromJson(const ofJson& json) {
	if (!json.is_object()) {
		return std::nullopt;
	}
	const auto idIt = json.find("id");
	const auto startedIt = json.find("startedAt");
	const auto elapsedIt = json.find("elapsedSeconds");
	const auto completedIt = json.find("completed");
	if (idIt == json.end() || !idIt->is_string() || idIt->get<std::string>().empty()) {
		return std::nullopt;
	}
	if (startedIt == json.end() || elapsedIt == json.end() || !elapsedIt->is_number_integer()) {
		return std::nullopt;
	}
	if (completedIt == json.end() || !completedIt->is_boolean()) {
		return std::nullopt;
	}

	SessionRecord record;
	record.id = idIt->get<std::string>();
	if (startedIt->is_string()) {
		const auto parsed = fromIso8601(startedIt->get<std::string>());
		if (!parsed.has_value()) {
			return std::nullopt;
		}
		record.startedAt = *parsed;
	} else if (startedIt->is_number_integer()) {
		record.startedAt = std::chrono::system_clock::time_point(std::chrono::seconds(startedIt->get<std::int64_t>()));
	} else {
		return std::nullopt;
	}

	record.elapsedSeconds = elapsedIt->get<std::int64_t>();
	if (record.elapsedSeconds < 0) {
		return std::nullopt;
	}
	record.completed = completedIt->get<bool>();

	const auto sourceIt = json.find("source");
	const auto stateIt = json.find("syncState");
	const auto retryIt = json.find("retryCount");
	if ((sourceIt != json.end() && !sourceIt->is_string()) || (stateIt != json.end() && !stateIt->is_string()) ||
	    (retryIt != json.end() && !retryIt->is_number_unsigned())) {
		return std::nullopt;
	}
	if (sourceIt != json.end()) {
		record.source = sessionSourceFromString(sourceIt->get<std::string>()).value_or(SessionSource::Manual);
	}

	const auto status = syncStatusFromString(stateIt != json.end() ? stateIt->get<std::string>() : "pending");
	if (!status.has_value()) {
		return std::nullopt;
	}
	record.syncState.status = *status;
	if (retryIt != json.end()) {
		record.syncState.retryCount = retryIt->get<std::uint32_t>();
	}
	return record;
}

}  // namespace bhvd
