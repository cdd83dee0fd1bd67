#pragma once

#include "SessionRecord.h"

namespace bhvd::infra {

/// Remote side of history sync. pushSession must be idempotent by record id: pushing
/// a record the backend already holds reports success.
class SessionSyncClient {
  public:
	virtual ~SessionSyncClient() = default;
	virtual bool pushSession(const SessionRecord& record) = 0;
};

}  // namespace bhvd::infra
