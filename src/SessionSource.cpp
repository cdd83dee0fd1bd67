#include "SessionSource.h"

#include <algorithm>
#include <cctype>

namespace bhvd {

std::string sessionSourceToString(SessionSource source) {
	switch (source) {
		case SessionSource::Manual:
			return "manual";
		case SessionSource::Tag:
			return "tag";
	}
	return "manual";
}

std::optional<SessionSource> sessionSourceFromString(const std::string& value) {
	std::string lowered(value.size(), '\0');
	std::transform(value.begin(), value.end(), lowered.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});

	if (lowered == "manual" || lowered.empty()) {
		return SessionSource::Manual;
	}
	if (lowered == "tag" || lowered == "nfc" || lowered == "link") {
		return SessionSource::Tag;
	}
	return std::nullopt;
}

}  // namespace bhvd
