#pragma once

#include "SessionRecord.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bhvd::infra {

class SessionSyncClient;

struct SyncReport {
	std::size_t attempted = 0;
	std::size_t synced = 0;
	std::size_t failed = 0;
};

struct HistorySummary {
	std::size_t sessionCount = 0;
	std::size_t completedCount = 0;
	std::int64_t totalSeconds = 0;
	std::int64_t totalMinutes = 0;
	std::size_t pendingSyncCount = 0;
};

/// Append-only session log in JSON lines. A line is either a full record entry or a
/// sync-state update for an earlier record; replaying the file in order rebuilds the
/// history. Unreadable lines are copied to a quarantine file and skipped.
class HistoryStore {
  public:
	explicit HistoryStore(const std::filesystem::path& logPath);
	~HistoryStore();

	HistoryStore(const HistoryStore&) = delete;
	HistoryStore& operator=(const HistoryStore&) = delete;
	HistoryStore(HistoryStore&&) = delete;
	HistoryStore& operator=(HistoryStore&&) = delete;

	/// Persists the record as Pending and flushes before returning. Throws
	/// SessionError(PersistenceFailed) if the line could not be written.
	void append(const SessionRecord& record);

	[[nodiscard]] std::vector<SessionRecord> listAll() const;
	[[nodiscard]] std::optional<SessionRecord> find(const std::string& id) const;
	[[nodiscard]] HistorySummary summary() const;

	/// Pushes every Pending/Failed record not already claimed by another call.
	SyncReport syncPending(SessionSyncClient& client);

	/// Largest numeric record id in the log, 0 when there is none. New ids must be
	/// issued above it so a clock step back across restarts cannot collide.
	[[nodiscard]] std::int64_t highestNumericId() const;

	[[nodiscard]] std::size_t quarantinedCount() const;
	[[nodiscard]] const std::filesystem::path& logPath() const noexcept { return logPath_; }
	[[nodiscard]] std::filesystem::path quarantinePath() const;

  private:
	void replay();
	void replayLine(const std::string& line, std::size_t lineNumber);
	void quarantine(const std::string& line, std::size_t lineNumber, const std::string& reason);
	void openStreamLocked();
	void writeEntryLocked(const ofJson& entry);

	std::filesystem::path logPath_;
	mutable std::mutex mutex_;
	std::ofstream stream_;
	std::vector<SessionRecord> records_;
	std::unordered_map<std::string, std::size_t> indexById_;
	std::unordered_set<std::string> inFlight_;
	std::size_t quarantined_ = 0;
};

}  // namespace bhvd::infra
