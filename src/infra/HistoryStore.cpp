#include "infra/HistoryStore.h"

#include "Errors.h"
#include "infra/SessionSyncClient.h"

#include "ofMain.h"

#include <algorithm>
#include <cctype>
#include <exception>

namespace bhvd::infra {

namespace {

constexpr const char* kRecordEntry = "record";
constexpr const char* kSyncEntry = "sync";

std::filesystem::path makeAbsolute(const std::filesystem::path& path) {
	if (path.is_absolute()) {
		return path;
	}
	return std::filesystem::absolute(std::filesystem::current_path() / path);
}

// A crash mid-write leaves a torn last line; the next entry must not be glued onto it.
bool endsWithNewline(const std::filesystem::path& path) {
	std::error_code ec;
	const auto size = std::filesystem::file_size(path, ec);
	if (ec || size == 0) {
		return true;
	}
	std::ifstream in(path, std::ios::in | std::ios::binary);
	if (!in.is_open()) {
		return true;
	}
	in.seekg(-1, std::ios::end);
	char last = '\n';
	in.get(last);
	return !in || last == '\n';
}

bool isNumericId(const std::string& id) {
	return !id.empty() && id.size() <= 18 &&
	       std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

ofJson makeRecordEntry(const SessionRecord& record) {
	ofJson entry = sessionRecordToJson(record);
	entry["type"] = kRecordEntry;
	return entry;
}

ofJson makeSyncEntry(const std::string& id, const SyncState& state) {
	return ofJson{
		{"type", kSyncEntry},
		{"id", id},
		{"syncState", syncStatusToString(state.status)},
		{"retryCount", state.retryCount},
	};
}

}  // namespace

HistoryStore::HistoryStore(const std::filesystem::path& logPath)
	: logPath_(makeAbsolute(logPath)) {
	std::error_code ec;
	std::filesystem::create_directories(logPath_.parent_path(), ec);
	if (ec) {
		ofLogWarning("HistoryStore") << "Failed to create directory: " << ec.message();
	}
	replay();
	std::lock_guard<std::mutex> lock(mutex_);
	openStreamLocked();
}

HistoryStore::~HistoryStore() {
	if (stream_.is_open()) {
		stream_.close();
	}
}

std::filesystem::path HistoryStore::quarantinePath() const {
	return logPath_.parent_path() / (logPath_.stem().string() + ".quarantine" + logPath_.extension().string());
}

void HistoryStore::replay() {
	if (!std::filesystem::exists(logPath_)) {
		ofLogNotice("HistoryStore") << "No history at " << logPath_ << ", starting empty";
		return;
	}

	ofBuffer buffer = ofBufferFromFile(logPath_.string());
	std::size_t lineNumber = 0;
	for (const auto& line : buffer.getLines()) {
		++lineNumber;
		const std::string trimmed = ofTrim(line);
		if (trimmed.empty()) {
			continue;
		}
		replayLine(trimmed, lineNumber);
	}

	ofLogNotice("HistoryStore") << "Loaded " << records_.size() << " sessions from " << logPath_
	                            << (quarantined_ > 0 ? " (" + ofToString(quarantined_) + " entries quarantined)" : "");
}

void HistoryStore::replayLine(const std::string& line, std::size_t lineNumber) {
	ofJson entry;
	try {
		entry = ofJson::parse(line);
	} catch (const std::exception& ex) {
		quarantine(line, lineNumber, std::string("unparsable: ") + ex.what());
		return;
	}

	if (!entry.is_object()) {
		quarantine(line, lineNumber, "entry is not an object");
		return;
	}
	const auto typeIt = entry.find("type");
	if (typeIt == entry.end() || !typeIt->is_string()) {
		quarantine(line, lineNumber, "missing or non-string entry type");
		return;
	}

	const std::string type = typeIt->get<std::string>();
	if (type == kRecordEntry) {
		const auto record = sessionRecordFromJson(entry);
		if (!record.has_value()) {
			quarantine(line, lineNumber, "record entry failed validation");
			return;
		}
		if (indexById_.count(record->id) > 0) {
			ofLogWarning("HistoryStore") << "Duplicate record " << record->id << " on line " << lineNumber
			                             << ", keeping the first";
			return;
		}
		indexById_.emplace(record->id, records_.size());
		records_.push_back(*record);
		return;
	}

	if (type == kSyncEntry) {
		const auto idIt = entry.find("id");
		const auto stateIt = entry.find("syncState");
		const auto retryIt = entry.find("retryCount");
		if (idIt == entry.end() || !idIt->is_string() || stateIt == entry.end() || !stateIt->is_string() ||
		    (retryIt != entry.end() && !retryIt->is_number_unsigned())) {
			quarantine(line, lineNumber, "sync entry with missing or mistyped fields");
			return;
		}
		const auto it = indexById_.find(idIt->get<std::string>());
		const auto status = syncStatusFromString(stateIt->get<std::string>());
		if (it == indexById_.end() || !status.has_value()) {
			quarantine(line, lineNumber, "sync entry for unknown record or state");
			return;
		}
		auto& stored = records_[it->second].syncState;
		stored.status = *status;
		if (retryIt != entry.end()) {
			stored.retryCount = retryIt->get<std::uint32_t>();
		}
		return;
	}

	quarantine(line, lineNumber, "unknown entry type '" + type + "'");
}

void HistoryStore::quarantine(const std::string& line, std::size_t lineNumber, const std::string& reason) {
	++quarantined_;
	ofLogWarning("HistoryStore") << errorCodeToString(ErrorCode::CorruptLocalState) << " at line " << lineNumber
	                             << ": " << reason;

	const auto path = quarantinePath();
	std::ofstream out(path, std::ios::out | std::ios::app);
	if (!out.is_open()) {
		ofLogError("HistoryStore") << "Failed to open quarantine file " << path;
		return;
	}
	out << line << '\n';
}

void HistoryStore::openStreamLocked() {
	if (stream_.is_open()) {
		return;
	}
	const bool terminated = endsWithNewline(logPath_);
	stream_.open(logPath_, std::ios::out | std::ios::app);
	if (!stream_.is_open()) {
		ofLogError("HistoryStore") << "Failed to open history log " << logPath_;
		return;
	}
	if (!terminated) {
		ofLogWarning("HistoryStore") << "History log ends with a torn line, starting a new one";
		stream_ << '\n';
		stream_.flush();
	}
}

void HistoryStore::writeEntryLocked(const ofJson& entry) {
	openStreamLocked();
	if (!stream_.is_open()) {
		throw SessionError(ErrorCode::PersistenceFailed, "history log not writable: " + logPath_.string());
	}
	stream_ << entry.dump() << '\n';
	stream_.flush();
	if (!stream_) {
		stream_.close();
		stream_.clear();
		throw SessionError(ErrorCode::PersistenceFailed, "write to " + logPath_.string() + " failed");
	}
}

void HistoryStore::append(const SessionRecord& record) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (indexById_.count(record.id) > 0) {
		ofLogWarning("HistoryStore") << "Record " << record.id << " already stored, ignoring";
		return;
	}

	SessionRecord stored = record;
	stored.syncState = {};
	writeEntryLocked(makeRecordEntry(stored));

	indexById_.emplace(stored.id, records_.size());
	records_.push_back(stored);
	ofLogNotice("HistoryStore") << "Stored session " << stored.id << " (" << stored.elapsedSeconds << "s, "
	                            << (stored.completed ? "completed" : "aborted") << ")";
}

std::vector<SessionRecord> HistoryStore::listAll() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return records_;
}

std::optional<SessionRecord> HistoryStore::find(const std::string& id) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = indexById_.find(id);
	if (it == indexById_.end()) {
		return std::nullopt;
	}
	return records_[it->second];
}

HistorySummary HistoryStore::summary() const {
	std::lock_guard<std::mutex> lock(mutex_);
	HistorySummary summary;
	summary.sessionCount = records_.size();
	for (const auto& record : records_) {
		if (record.completed) {
			++summary.completedCount;
		}
		if (record.syncState.needsSync()) {
			++summary.pendingSyncCount;
		}
		summary.totalSeconds += record.elapsedSeconds;
	}
	summary.totalMinutes = summary.totalSeconds / 60;
	return summary;
}

std::int64_t HistoryStore::highestNumericId() const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::int64_t highest = 0;
	for (const auto& record : records_) {
		if (isNumericId(record.id)) {
			highest = std::max(highest, ofToInt64(record.id));
		}
	}
	return highest;
}

std::size_t HistoryStore::quarantinedCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return quarantined_;
}

SyncReport HistoryStore::syncPending(SessionSyncClient& client) {
	std::vector<SessionRecord> claimed;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		for (const auto& record : records_) {
			if (record.syncState.needsSync() && inFlight_.insert(record.id).second) {
				claimed.push_back(record);
			}
		}
	}

	SyncReport report;
	for (const auto& record : claimed) {
		++report.attempted;
		bool pushed = false;
		try {
			pushed = client.pushSession(record);
		} catch (const std::exception& ex) {
			ofLogError("HistoryStore") << "Sync client threw for " << record.id << ": " << ex.what();
		}

		std::lock_guard<std::mutex> lock(mutex_);
		auto& stored = records_[indexById_.at(record.id)];
		SyncState next = stored.syncState;
		if (pushed) {
			next.status = SyncStatus::Synced;
			++report.synced;
		} else {
			next.status = SyncStatus::Failed;
			++next.retryCount;
			++report.failed;
			ofLogWarning("HistoryStore") << errorCodeToString(ErrorCode::SyncFailed) << " for " << record.id
			                             << ", attempt " << next.retryCount << ", will retry";
		}

		try {
			writeEntryLocked(makeSyncEntry(record.id, next));
		} catch (const SessionError& ex) {
			ofLogError("HistoryStore") << "Sync state for " << record.id << " not persisted: " << ex.what();
		}
		stored.syncState = next;
		inFlight_.erase(record.id);
	}

	if (report.attempted > 0) {
		ofLogNotice("HistoryStore") << "Sync pass: " << report.synced << " synced, " << report.failed << " failed";
	}
	return report;
}

}  // namespace bhvd::infra
