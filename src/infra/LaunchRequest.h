#pragma once

#include "SessionSource.h"

#include <optional>
#include <string>

namespace bhvd::infra {

struct LaunchRequest {
	SessionSource source = SessionSource::Tag;
	std::string uri;
};

/// Recognizes bhvd://session and https://bhvd.app/session (with optional trailing path
/// or query). A `source=` query parameter overrides the default Tag source.
std::optional<LaunchRequest> parseLaunchUri(const std::string& uri);

}  // namespace bhvd::infra
