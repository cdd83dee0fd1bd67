#include "infra/SyncWorker.h"

#include <algorithm>

namespace bhvd::infra {

SyncWorker::SyncWorker(HistoryStore& store, std::unique_ptr<SessionSyncClient> client, double intervalSeconds)
	: store_(store)
	, client_(std::move(client))
	, interval_(std::chrono::milliseconds(static_cast<long long>(std::max(intervalSeconds, 0.1) * 1000.0))) {}

SyncWorker::~SyncWorker() {
	stop();
}

void SyncWorker::start() {
	if (isThreadRunning()) {
		return;
	}
	{
		std::lock_guard<std::mutex> lock(wakeMutex_);
		stopRequested_ = false;
		syncRequested_ = true;   // first pass drains whatever the last run left pending
	}
	ofLogNotice("SyncWorker") << "Starting, interval " << interval_.count() << "ms";
	startThread();
}

void SyncWorker::stop() {
	{
		std::lock_guard<std::mutex> lock(wakeMutex_);
		stopRequested_ = true;
	}
	wake_.notify_all();
	waitForThread(true);
}

void SyncWorker::requestSync() {
	{
		std::lock_guard<std::mutex> lock(wakeMutex_);
		syncRequested_ = true;
	}
	wake_.notify_all();
}

SyncReport SyncWorker::lastReport() const {
	std::lock_guard<std::mutex> lock(wakeMutex_);
	return lastReport_;
}

std::size_t SyncWorker::passCount() const {
	std::lock_guard<std::mutex> lock(wakeMutex_);
	return passCount_;
}

void SyncWorker::threadedFunction() {
	while (isThreadRunning()) {
		{
			std::unique_lock<std::mutex> lock(wakeMutex_);
			wake_.wait_for(lock, interval_, [this] { return syncRequested_ || stopRequested_; });
			if (stopRequested_) {
				break;
			}
			syncRequested_ = false;
		}

		const SyncReport report = store_.syncPending(*client_);

		std::lock_guard<std::mutex> lock(wakeMutex_);
		lastReport_ = report;
		++passCount_;
	}
	ofLogNotice("SyncWorker") << "Stopped";
}

}  // namespace bhvd::infra
