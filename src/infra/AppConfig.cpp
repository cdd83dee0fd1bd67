#include "infra/AppConfig.h"

#include <algorithm>

namespace bhvd::infra {

namespace {

std::filesystem::path makeAbsolute(const std::filesystem::path& path) {
	if (path.is_absolute()) {
		return path;
	}
	return std::filesystem::absolute(std::filesystem::current_path() / path);
}

template <typename T>
T positiveOr(T value, T fallback, const char* key) {
	if (value > T{}) {
		return value;
	}
	ofLogWarning("AppConfigLoader") << key << " must be positive, using " << fallback;
	return fallback;
}

}  // namespace

ofLogLevel logLevelFromString(const std::string& value) {
	const std::string lower = ofToLower(value);
	if (lower == "verbose") {
		return OF_LOG_VERBOSE;
	}
	if (lower == "warning") {
		return OF_LOG_WARNING;
	}
	if (lower == "error") {
		return OF_LOG_ERROR;
	}
	if (lower != "notice" && !lower.empty()) {
		ofLogWarning("AppConfigLoader") << "Unknown log level '" << value << "', using notice";
	}
	return OF_LOG_NOTICE;
}

AppConfig AppConfigLoader::load(const std::filesystem::path& configRelativePath) const {
	const auto absolutePath = std::filesystem::path(ofToDataPath(configRelativePath.string(), true));
	return fromJson(loadOrCreateDefault(absolutePath));
}

AppConfig AppConfigLoader::fromJson(const ofJson& json) {
	AppConfig config;
	audio::AudioEngineSettings& audio = config.audio;

	const auto audioJson = json.value("audio", ofJson::object());
	audio.output.sampleRate = positiveOr(audioJson.value("sampleRate", 48000.0), 48000.0, "audio.sampleRate");
	audio.output.bufferSize =
		static_cast<std::size_t>(positiveOr(audioJson.value("bufferSize", 512), 512, "audio.bufferSize"));
	audio.targetVolume = std::clamp(audioJson.value("targetVolume", 0.5f), 0.0f, 1.0f);
	audio.fadeInSeconds = std::max(audioJson.value("fadeInSeconds", 2.0), 0.0);
	audio.fadeOutSeconds = std::max(audioJson.value("fadeOutSeconds", 1.0), 0.0);
	audio.loopSeconds = std::max(audioJson.value("loopSeconds", 5.0), 0.0);
	audio.seed = audioJson.value("seed", 0u);
	audio.callbackTimeoutSeconds = audioJson.value("callbackTimeoutSeconds", 0.5);
	const auto noiseJson = audioJson.value("noise", ofJson::object());
	audio.noise.smoothing = noiseJson.value("smoothing", audio.noise.smoothing);
	audio.noise.gainCompensation = noiseJson.value("gainCompensation", audio.noise.gainCompensation);
	audio.noise.subtlety = noiseJson.value("subtlety", audio.noise.subtlety);
	if (audio.noise.smoothing <= 0.0f || audio.noise.smoothing >= 1.0f) {
		ofLogWarning("AppConfigLoader") << "audio.noise.smoothing out of (0, 1), using default";
		audio.noise.smoothing = audio::NoiseParameters{}.smoothing;
	}
	config.outputDevice = audioJson.value("outputDevice", "");

	const auto historyJson = json.value("history", ofJson::object());
	config.history.logPath = makeAbsolute(std::filesystem::path(
		ofToDataPath(historyJson.value("logPath", "history/sessions.jsonl"), true)));

	const auto syncJson = json.value("sync", ofJson::object());
	config.sync.endpoint = syncJson.value("endpoint", "");
	config.sync.apiKey = syncJson.value("apiKey", "");
	config.sync.intervalSeconds =
		positiveOr(syncJson.value("intervalSeconds", 60.0), 60.0, "sync.intervalSeconds");

	const auto loggingJson = json.value("logging", ofJson::object());
	config.logging.level = logLevelFromString(loggingJson.value("level", "notice"));
	const std::string logFile = loggingJson.value("file", "");
	if (!logFile.empty()) {
		config.logging.file = makeAbsolute(std::filesystem::path(ofToDataPath(logFile, true)));
	}

	config.phaseTransitionCsvPath = makeAbsolute(std::filesystem::path(
		ofToDataPath(json.value("phaseTransitionCsv", "../logs/phase_transitions.csv"), true)));
	config.sessionTimingConfigPath =
		std::filesystem::path(json.value("sessionTimingConfig", "config/session_timing.json"));
	return config;
}

void AppConfigLoader::applyLogging(const LoggingConfig& logging) {
	ofSetLogLevel(logging.level);
	if (logging.file.empty()) {
		return;
	}
	std::error_code ec;
	std::filesystem::create_directories(logging.file.parent_path(), ec);
	if (ec) {
		ofLogWarning("AppConfigLoader") << "Failed to create log directory: " << ec.message();
	}
	ofLogToFile(logging.file.string(), true);
	ofLogNotice("AppConfigLoader") << "Logging to " << logging.file;
}

ofJson AppConfigLoader::loadOrCreateDefault(const std::filesystem::path& absolutePath) {
	std::error_code ec;
	std::filesystem::create_directories(absolutePath.parent_path(), ec);
	if (std::filesystem::exists(absolutePath)) {
		try {
			const ofJson json = ofLoadJson(absolutePath.string());
			if (json.is_object()) {
				return json;
			}
			ofLogError("AppConfigLoader") << "Config is not an object: " << absolutePath;
		} catch (const std::exception& ex) {
			ofLogError("AppConfigLoader") << "Failed to parse config: " << absolutePath << " reason: " << ex.what();
		}
	}
	const ofJson def = makeDefaultConfig(absolutePath);
	ofSavePrettyJson(absolutePath.string(), def);
	return def;
}

ofJson AppConfigLoader::makeDefaultConfig(const std::filesystem::path& absolutePath) {
	ofLogWarning("AppConfigLoader") << "Creating default config at " << absolutePath;
	return ofJson{
		{"audio",
		 {
			 {"sampleRate", 48000},
			 {"bufferSize", 512},
			 {"targetVolume", 0.5},
			 {"fadeInSeconds", 2.0},
			 {"fadeOutSeconds", 1.0},
			 {"loopSeconds", 5.0},
			 {"noise", {{"smoothing", 0.02}, {"gainCompensation", 3.5}, {"subtlety", 0.1}}},
			 {"seed", 0},
			 {"callbackTimeoutSeconds", 0.5},
			 {"outputDevice", ""},
		 }},
		{"history", {{"logPath", "history/sessions.jsonl"}}},
		{"sync", {{"endpoint", ""}, {"apiKey", ""}, {"intervalSeconds", 60}}},
		{"logging", {{"level", "notice"}, {"file", ""}}},
		{"phaseTransitionCsv", "../logs/phase_transitions.csv"},
		{"sessionTimingConfig", "config/session_timing.json"},
	};
}

}  // namespace bhvd::infra
