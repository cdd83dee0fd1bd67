#include "SessionTimingConfig.h"

#include "ofMain.h"

#include <cmath>

namespace bhvd {

namespace {

std::filesystem::path resolveDataPath(const std::filesystem::path& relativePath) {
	std::filesystem::path dataPath(ofToDataPath(relativePath.string(), true));
	if (std::filesystem::exists(dataPath)) {
		return dataPath;
	}
	if (relativePath.is_absolute()) {
		return relativePath;
	}
	return std::filesystem::absolute(std::filesystem::current_path() / relativePath);
}

std::int64_t readSeconds(const ofJson& json, const char* key, std::int64_t fallback) {
	const auto it = json.find(key);
	if (it == json.end() || !it->is_number()) {
		return fallback;
	}
	return static_cast<std::int64_t>(std::llround(it->get<double>()));
}

}  // namespace

SessionTimingConfig SessionTimingConfig::load(const std::filesystem::path& relativePath) {
	const auto absolutePath = resolveDataPath(relativePath);

	if (!std::filesystem::exists(absolutePath)) {
		ofLogWarning("SessionTimingConfig") << "Config not found: " << absolutePath << ", using defaults";
		return {};
	}

	ofJson json;
	try {
		json = ofLoadJson(absolutePath.string());
	} catch (const std::exception& ex) {
		ofLogError("SessionTimingConfig") << "Failed to parse config: " << ex.what();
		return {};
	}
	return fromJson(json);
}

SessionTimingConfig SessionTimingConfig::fromJson(const ofJson& json) {
	SessionTimingConfig config;
	if (!json.is_object()) {
		ofLogWarning("SessionTimingConfig") << "Timing config is not an object, using defaults";
		return config;
	}

	SessionConfig parsed;
	parsed.totalDurationSeconds = readSeconds(json, "totalDurationSeconds", parsed.totalDurationSeconds);
	parsed.entryEndSeconds = readSeconds(json, "entryEndSeconds", parsed.entryEndSeconds);
	parsed.immersionEndSeconds = readSeconds(json, "immersionEndSeconds", parsed.immersionEndSeconds);
	if (parsed.isValid()) {
		config.base_ = parsed;
	} else {
		ofLogWarning("SessionTimingConfig") << "Invalid thresholds total=" << parsed.totalDurationSeconds
		                                    << " entryEnd=" << parsed.entryEndSeconds
		                                    << " immersionEnd=" << parsed.immersionEndSeconds << ", using defaults";
	}

	if (json.contains("testMode") && json["testMode"].is_object()) {
		const auto& testMode = json["testMode"];
		config.testModeEnabled_ = testMode.value("enabled", false);
		const double scale = testMode.value("scaleFactor", 1.0);
		config.testScaleFactor_ = (scale > 0.0) ? scale : 1.0;
	}

	return config;
}

SessionConfig SessionTimingConfig::effectiveConfig() const {
	if (!testModeEnabled_) {
		return base_;
	}
	auto scale = [this](std::int64_t seconds) {
		return static_cast<std::int64_t>(std::llround(static_cast<double>(seconds) * testScaleFactor_));
	};
	SessionConfig scaled;
	scaled.totalDurationSeconds = scale(base_.totalDurationSeconds);
	scaled.entryEndSeconds = scale(base_.entryEndSeconds);
	scaled.immersionEndSeconds = scale(base_.immersionEndSeconds);
	if (!scaled.isValid()) {
		ofLogWarning("SessionTimingConfig") << "Scale factor " << testScaleFactor_
		                                    << " collapses the thresholds, ignoring test mode";
		return base_;
	}
	return scaled;
}

}  // namespace bhvd
