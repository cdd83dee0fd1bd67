#include "infra/LaunchRequest.h"

#include "ofMain.h"

namespace bhvd::infra {

namespace {

const char* const kSessionPrefixes[] = {
	"bhvd://session",
	"https://bhvd.app/session",
	"http://bhvd.app/session",
};

bool hasSessionPrefix(const std::string& lowerUri, std::string& remainder) {
	for (const char* prefix : kSessionPrefixes) {
		const std::string p(prefix);
		if (lowerUri.compare(0, p.size(), p) != 0) {
			continue;
		}
		remainder = lowerUri.substr(p.size());
		// "sessions" or "session-x" is a different route.
		if (remainder.empty() || remainder[0] == '/' || remainder[0] == '?' || remainder[0] == '#') {
			return true;
		}
	}
	return false;
}

std::optional<std::string> queryValue(const std::string& remainder, const std::string& key) {
	const auto queryStart = remainder.find('?');
	if (queryStart == std::string::npos) {
		return std::nullopt;
	}
	std::string query = remainder.substr(queryStart + 1);
	const auto fragment = query.find('#');
	if (fragment != std::string::npos) {
		query.resize(fragment);
	}
	for (const auto& pair : ofSplitString(query, "&", true, true)) {
		const auto eq = pair.find('=');
		if (eq == std::string::npos) {
			continue;
		}
		if (pair.substr(0, eq) == key) {
			return pair.substr(eq + 1);
		}
	}
	return std::nullopt;
}

}  // namespace

std::optional<LaunchRequest> parseLaunchUri(const std::string& uri) {
	const std::string trimmed = ofTrim(uri);
	std::string remainder;
	if (!hasSessionPrefix(ofToLower(trimmed), remainder)) {
		return std::nullopt;
	}

	LaunchRequest request;
	request.uri = trimmed;
	if (const auto source = queryValue(remainder, "source")) {
		if (const auto parsed = sessionSourceFromString(*source)) {
			request.source = *parsed;
		} else {
			ofLogWarning("LaunchRequest") << "Unknown source '" << *source << "' in " << trimmed << ", using tag";
		}
	}
	return request;
}

}  // namespace bhvd::infra
