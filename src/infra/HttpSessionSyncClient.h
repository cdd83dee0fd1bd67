#pragma once

#include "infra/SessionSyncClient.h"

#include "ofMain.h"

#include <string>

namespace bhvd::infra {

class HttpSessionSyncClient : public SessionSyncClient {
  public:
	HttpSessionSyncClient(std::string endpoint, std::string apiKey, float timeoutSeconds = 10.0f);

	bool pushSession(const SessionRecord& record) override;

	ofHttpRequest buildRequest(const SessionRecord& record) const;
	const std::string& endpoint() const { return endpoint_; }

	/// 2xx, and 409 for a record the backend already stored.
	static bool isSuccessStatus(int status);

  private:
	std::string endpoint_;
	std::string apiKey_;
	float timeoutSeconds_;
	ofURLFileLoader loader_;
};

}  // namespace bhvd::infra
