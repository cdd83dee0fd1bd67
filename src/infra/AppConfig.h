#pragma once

#include "audio/AudioEngine.h"

#include "ofMain.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace bhvd::infra {

struct HistoryConfig {
	std::filesystem::path logPath;
};

struct SyncConfig {
	std::string endpoint;   // empty disables remote sync
	std::string apiKey;
	double intervalSeconds = 60.0;

	bool enabled() const { return !endpoint.empty(); }
};

struct LoggingConfig {
	ofLogLevel level = OF_LOG_NOTICE;
	std::filesystem::path file;   // empty logs to the console
};

struct AppConfig {
	audio::AudioEngineSettings audio;
	std::string outputDevice;
	HistoryConfig history;
	SyncConfig sync;
	LoggingConfig logging;
	std::filesystem::path phaseTransitionCsvPath;
	std::filesystem::path sessionTimingConfigPath;
};

class AppConfigLoader {
  public:
	AppConfig load(const std::filesystem::path& configRelativePath) const;
	static AppConfig fromJson(const ofJson& json);

	/// Applies the logging section: level first, then the optional file channel.
	static void applyLogging(const LoggingConfig& logging);

  private:
	static ofJson loadOrCreateDefault(const std::filesystem::path& absolutePath);
	static ofJson makeDefaultConfig(const std::filesystem::path& absolutePath);
};

ofLogLevel logLevelFromString(const std::string& value);

}  // namespace bhvd::infra
