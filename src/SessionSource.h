#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bhvd {

/// Where a session start request came from: the in-app button or a scanned tag / deep link.
enum class SessionSource : std::uint8_t {
	Manual = 0,
	Tag = 1
};

std::string sessionSourceToString(SessionSource source);
std::optional<SessionSource> sessionSourceFromString(const std::string& value);

}  // namespace bhvd
