#pragma once

#include "infra/HistoryStore.h"
#include "infra/SessionSyncClient.h"

#include "ofMain.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace bhvd::infra {

/// Background sync loop: one syncPending pass every interval, or sooner after
/// requestSync(). Owns the client; borrows the store.
class SyncWorker : public ofThread {
  public:
	SyncWorker(HistoryStore& store, std::unique_ptr<SessionSyncClient> client, double intervalSeconds);
	~SyncWorker() override;

	void start();
	void stop();
	void requestSync();

	SyncReport lastReport() const;
	std::size_t passCount() const;

  protected:
	void threadedFunction() override;

  private:
	HistoryStore& store_;
	std::unique_ptr<SessionSyncClient> client_;
	std::chrono::milliseconds interval_;

	mutable std::mutex wakeMutex_;
	std::condition_variable wake_;
	bool syncRequested_ = false;
	bool stopRequested_ = false;
	SyncReport lastReport_{};
	std::size_t passCount_ = 0;
};

}  // namespace bhvd::infra
