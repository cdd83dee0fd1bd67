#include "infra/HttpSessionSyncClient.h"

namespace bhvd::infra {

HttpSessionSyncClient::HttpSessionSyncClient(std::string endpoint, std::string apiKey, float timeoutSeconds)
	: endpoint_(std::move(endpoint))
	, apiKey_(std::move(apiKey))
	, timeoutSeconds_(timeoutSeconds) {}

bool HttpSessionSyncClient::isSuccessStatus(int status) {
	return (status >= 200 && status < 300) || status == 409;
}

ofHttpRequest HttpSessionSyncClient::buildRequest(const SessionRecord& record) const {
	ofHttpRequest request(endpoint_, "session-" + record.id);
	request.method = ofHttpRequest::POST;
	request.contentType = "application/json";
	request.body = sessionRecordToJson(record).dump();
	request.timeoutSeconds = timeoutSeconds_;
	request.headers["Idempotency-Key"] = record.id;
	if (!apiKey_.empty()) {
		request.headers["apikey"] = apiKey_;
		request.headers["Authorization"] = "Bearer " + apiKey_;
	}
	return request;
}

bool HttpSessionSyncClient::pushSession(const SessionRecord& record) {
	const ofHttpResponse response = loader_.handleRequest(buildRequest(record));
	if (isSuccessStatus(response.status)) {
		ofLogVerbose("HttpSessionSyncClient") << "Pushed " << record.id << " (" << response.status << ")";
		return true;
	}
	ofLogWarning("HttpSessionSyncClient") << "Push of " << record.id << " to " << endpoint_ << " failed: "
	                                      << response.status << " " << response.error;
	return false;
}

}  // namespace bhvd::infra
