#include "ofApp.h"

#include "Errors.h"
#include "audio/SoundStreamOutput.h"
#include "audio/Utility.h"
#include "infra/HttpSessionSyncClient.h"
#include "infra/LaunchRequest.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include <glm/vec2.hpp>

namespace {

constexpr double kPersistRetryIntervalSec = 5.0;

double monotonicSeconds() {
    return static_cast<double>(ofGetElapsedTimeMicros()) * 1e-6;
}

std::string formatGain(float gain) {
    if (gain <= 0.0f) {
        return "-inf dB";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << bhvd::audio::linearToDb(gain) << " dB";
    return oss.str();
}

std::string makeSessionId(std::chrono::system_clock::time_point startedAt) {
    return std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(startedAt.time_since_epoch()).count());
}

}  // namespace

ofApp::ofApp(std::string launchUri)
    : launchUri_(std::move(launchUri)) {}

void ofApp::setup() {
    ofSetVerticalSync(true);
    ofSetFrameRate(30);
    ofBackground(12, 10, 8);

    bhvd::infra::AppConfigLoader loader;
    appConfig_ = loader.load("config/app_config.json");
    bhvd::infra::AppConfigLoader::applyLogging(appConfig_.logging);

    timingConfig_ = bhvd::SessionTimingConfig::load(appConfig_.sessionTimingConfigPath);
    if (timingConfig_.testModeEnabled()) {
        ofLogWarning("ofApp") << "Test mode active, timings scaled by " << timingConfig_.testScaleFactor();
    }

    phaseTransitionLogger_.setup(appConfig_.phaseTransitionCsvPath);

    bool displayLoaded = displayFont_.load("fonts/NotoSans-Thin.ttf", 96, true, true, true);
    if (!displayLoaded) {
        ofLogWarning("ofApp") << "Failed to load fonts/NotoSans-Thin.ttf. Falling back to system font.";
        displayFont_.load(OF_TTF_SANS, 96, true, true, true);
    }
    bool guideLoaded = guideFont_.load("fonts/NotoSans-Regular.ttf", 28, true, true, true);
    if (!guideLoaded) {
        ofLogWarning("ofApp") << "Failed to load fonts/NotoSans-Regular.ttf. Falling back to system font.";
        guideFont_.load(OF_TTF_SANS, 28, true, true, true);
    }

    auto output = std::make_unique<bhvd::audio::SoundStreamOutput>(appConfig_.outputDevice);
    audioEngine_ = std::make_unique<bhvd::audio::AudioEngine>(std::move(output), appConfig_.audio, &monotonicSeconds);
    if (!audioEngine_->initialize()) {
        ofLogWarning("ofApp") << "Audio unavailable, sessions will run silently.";
    }

    sessionController_ = std::make_unique<bhvd::SessionController>(
        *audioEngine_, [] { return std::chrono::system_clock::now(); });

    historyStore_ = std::make_unique<bhvd::infra::HistoryStore>(appConfig_.history.logPath);
    sessionController_->reserveRecordIdsThrough(historyStore_->highestNumericId());
    if (appConfig_.sync.enabled()) {
        auto client = std::make_unique<bhvd::infra::HttpSessionSyncClient>(appConfig_.sync.endpoint,
                                                                          appConfig_.sync.apiKey);
        syncWorker_ = std::make_unique<bhvd::infra::SyncWorker>(*historyStore_, std::move(client),
                                                               appConfig_.sync.intervalSeconds);
        syncWorker_->start();
    } else {
        ofLogNotice("ofApp") << "No sync endpoint configured, history stays local.";
    }

    controlPanel_.setup("Session");
    controlPanel_.setPosition(20.0f, 20.0f);
    controlPanel_.add(startButton_.setup("Start (s)"));
    controlPanel_.add(pauseButton_.setup("Pause (space)"));
    controlPanel_.add(resumeButton_.setup("Resume (space)"));
    controlPanel_.add(abortButton_.setup("Abort (a)"));
    controlPanel_.add(audioEnabledParam_.set("Audio", true));
    controlPanel_.add(volumeParam_.set("Volume", audioEngine_->targetVolume(), 0.0f, 1.0f));

    startButton_.addListener(this, &ofApp::onStartButtonPressed);
    pauseButton_.addListener(this, &ofApp::onPauseButtonPressed);
    resumeButton_.addListener(this, &ofApp::onResumeButtonPressed);
    abortButton_.addListener(this, &ofApp::onAbortButtonPressed);
    audioEnabledParam_.addListener(this, &ofApp::onAudioEnabledChanged);
    volumeParam_.addListener(this, &ofApp::onVolumeChanged);

    statusPanel_.setup("Status");
    statusPanel_.add(phaseParam_.set("Phase", "Idle"));
    statusPanel_.add(remainingParam_.set("Remaining", "--:--"));
    statusPanel_.add(engineStateParam_.set("Engine", "-"));
    statusPanel_.add(gainParam_.set("Gain", "-inf dB"));
    statusPanel_.add(historyParam_.set("History", "-"));
    statusPanel_.add(syncParam_.set("Sync", syncWorker_ ? "idle" : "off"));
    windowResized(ofGetWidth(), ofGetHeight());

    if (!launchUri_.empty()) {
        if (const auto request = bhvd::infra::parseLaunchUri(launchUri_)) {
            ofLogNotice("ofApp") << "Launched from " << request->uri;
            requestSessionStart(request->source);
        } else {
            ofLogWarning("ofApp") << "Ignoring unrecognized launch uri: " << launchUri_;
        }
    }
}

void ofApp::update() {
    const double nowSeconds = monotonicSeconds();

    audioEngine_->update();
    sessionController_->tick();

    processPhaseEvents();
    drainSessionRecords();
    persistPendingRecords(nowSeconds);
    drainEngineErrors();
    updateStatusGui();
}

void ofApp::draw() {
    const float nowSeconds = ofGetElapsedTimef();
    drawSession(nowSeconds);
    controlPanel_.draw();
    statusPanel_.draw();
}

void ofApp::exit() {
    startButton_.removeListener(this, &ofApp::onStartButtonPressed);
    pauseButton_.removeListener(this, &ofApp::onPauseButtonPressed);
    resumeButton_.removeListener(this, &ofApp::onResumeButtonPressed);
    abortButton_.removeListener(this, &ofApp::onAbortButtonPressed);
    audioEnabledParam_.removeListener(this, &ofApp::onAudioEnabledChanged);
    volumeParam_.removeListener(this, &ofApp::onVolumeChanged);

    if (sessionController_ && sessionController_->isActive()) {
        ofLogNotice("ofApp") << "Exiting with an active session, recording it as aborted.";
        abortSession();
        processPhaseEvents();
        drainSessionRecords();
    }
    if (!unpersistedRecords_.empty()) {
        persistPendingRecords(nextPersistAttemptAt_);
    }

    if (syncWorker_) {
        syncWorker_->stop();
        syncWorker_.reset();
    }
    sessionController_.reset();
    audioEngine_.reset();
    historyStore_.reset();
    phaseTransitionLogger_.flush();
}

void ofApp::keyPressed(int key) {
    switch (key) {
        case ' ':
            togglePause();
            break;
        case 's':
        case 'S':
            requestSessionStart(bhvd::SessionSource::Manual);
            break;
        case 'a':
        case 'A':
            abortSession();
            break;
        case 'i':
        case 'I':
            toggleInterruption();
            break;
        default:
            break;
    }
}

void ofApp::windowResized(int w, int) {
    statusPanel_.setPosition(static_cast<float>(w) - statusPanel_.getWidth() - 20.0f, 20.0f);
}

void ofApp::onStartButtonPressed() {
    requestSessionStart(bhvd::SessionSource::Manual);
}

void ofApp::onPauseButtonPressed() {
    try {
        sessionController_->pause();
    } catch (const bhvd::SessionError& ex) {
        ofLogWarning("ofApp") << ex.what();
    }
}

void ofApp::onResumeButtonPressed() {
    try {
        sessionController_->resume();
        interruptionActive_ = false;
    } catch (const bhvd::SessionError& ex) {
        ofLogWarning("ofApp") << ex.what();
    }
}

void ofApp::onAbortButtonPressed() {
    abortSession();
}

void ofApp::onAudioEnabledChanged(bool& enabled) {
    sessionController_->setAudioEnabled(enabled);
    ofLogNotice("ofApp") << "Audio " << (enabled ? "enabled" : "muted");
}

void ofApp::onVolumeChanged(float& volume) {
    audioEngine_->setVolume(volume);
}

void ofApp::requestSessionStart(bhvd::SessionSource source) {
    try {
        sessionController_->start(timingConfig_.effectiveConfig(), source);
        currentSessionId_ = makeSessionId(sessionController_->startedAt());
    } catch (const bhvd::SessionError& ex) {
        ofLogWarning("ofApp") << "Start rejected: " << ex.what();
    }
}

void ofApp::togglePause() {
    if (!sessionController_->isActive()) {
        return;
    }
    if (sessionController_->isPaused()) {
        onResumeButtonPressed();
    } else {
        onPauseButtonPressed();
    }
}

void ofApp::abortSession() {
    try {
        sessionController_->abort();
    } catch (const bhvd::SessionError& ex) {
        ofLogWarning("ofApp") << ex.what();
    }
}

void ofApp::toggleInterruption() {
    interruptionActive_ = !interruptionActive_;
    ofLogNotice("ofApp") << "Simulated interruption " << (interruptionActive_ ? "began" : "ended");
    sessionController_->onInterruption(interruptionActive_, true);
}

void ofApp::processPhaseEvents() {
    while (const auto event = sessionController_->popPhaseEvent()) {
        phaseTransitionLogger_.recordTransition(
            bhvd::infra::PhaseTransitionLogger::fromEvent(*event, currentSessionId_));
        ofLogNotice("ofApp") << "Phase " << bhvd::sessionPhaseToString(event->from) << " -> "
                             << bhvd::sessionPhaseToString(event->to) << " at " << event->elapsedSeconds << "s ("
                             << event->trigger << ")";
    }
}

void ofApp::drainSessionRecords() {
    while (auto record = sessionController_->popRecord()) {
        unpersistedRecords_.push_back(std::move(*record));
    }
}

void ofApp::persistPendingRecords(double nowSeconds) {
    if (unpersistedRecords_.empty() || nowSeconds < nextPersistAttemptAt_) {
        return;
    }
    while (!unpersistedRecords_.empty()) {
        try {
            historyStore_->append(unpersistedRecords_.front());
        } catch (const bhvd::SessionError& ex) {
            ofLogError("ofApp") << ex.what() << ", retrying in " << kPersistRetryIntervalSec << "s";
            nextPersistAttemptAt_ = nowSeconds + kPersistRetryIntervalSec;
            return;
        }
        unpersistedRecords_.pop_front();
        if (syncWorker_) {
            syncWorker_->requestSync();
        }
    }
}

void ofApp::drainEngineErrors() {
    while (const auto error = audioEngine_->popError()) {
        lastEngineError_ = bhvd::errorCodeToString(error->code);
        ofLogError("ofApp") << "Audio engine: " << lastEngineError_ << ": " << error->message;
    }
}

void ofApp::updateStatusGui() {
    const auto& controller = *sessionController_;
    std::string phase = bhvd::sessionPhaseToString(controller.phase());
    if (controller.isSuspendedByInterruption()) {
        phase += " (interrupted)";
    } else if (controller.isPaused()) {
        phase += " (paused)";
    }
    phaseParam_.set(phase);
    remainingParam_.set(controller.isActive() ? bhvd::formatClock(controller.remainingSeconds()) : "--:--");

    std::string engineState = bhvd::audio::engineStateToString(audioEngine_->state());
    if (!lastEngineError_.empty()) {
        engineState += " [" + lastEngineError_ + "]";
    }
    engineStateParam_.set(engineState);
    gainParam_.set(formatGain(audioEngine_->currentGain()));

    const auto summary = historyStore_->summary();
    historyParam_.set(ofToString(summary.sessionCount) + " sessions, " + ofToString(summary.totalMinutes) + " min");
    if (syncWorker_) {
        const auto report = syncWorker_->lastReport();
        syncParam_.set(ofToString(summary.pendingSyncCount) + " pending, last " + ofToString(report.synced) + "/" +
                       ofToString(report.attempted));
    }
}

void ofApp::drawSession(float nowSeconds) {
    const auto& controller = *sessionController_;
    const float centerY = ofGetHeight() * 0.45f;

    if (!controller.isActive()) {
        ofSetColor(220, 210, 200);
        const std::string title =
            controller.phase() == bhvd::SessionPhase::Completed ? "Session complete" : "Press s to begin";
        drawCentered(guideFont_, title, centerY);
        const auto summary = historyStore_->summary();
        ofSetColor(160, 150, 140);
        drawCentered(guideFont_,
                     ofToString(summary.sessionCount) + " sessions  |  " + ofToString(summary.totalMinutes) +
                         " minutes",
                     centerY + 60.0f);
        return;
    }

    if (controller.phase() == bhvd::SessionPhase::Immersion && !controller.isPaused()) {
        drawBreathingRing(nowSeconds);
    }

    const float alpha = controller.isPaused() ? 120.0f : 235.0f;
    ofSetColor(235, 225, 215, static_cast<int>(alpha));
    drawCentered(displayFont_, bhvd::formatClock(controller.remainingSeconds()), centerY);

    ofSetColor(200, 190, 180, static_cast<int>(alpha));
    drawCentered(guideFont_, bhvd::phaseGuidance(controller.phase()), centerY + 80.0f);
    if (controller.isPaused()) {
        drawCentered(guideFont_, "Paused - press space to resume", centerY + 130.0f);
    }
}

void ofApp::drawBreathingRing(float nowSeconds) {
    const float pulse = 0.5f + 0.5f * std::sin(nowSeconds * 0.6f);
    const float radius = 140.0f + 40.0f * pulse;
    const float gain = std::clamp(audioEngine_->currentGain() / std::max(audioEngine_->targetVolume(), 0.01f), 0.0f, 1.0f);
    ofPushStyle();
    ofNoFill();
    ofSetLineWidth(3.0f);
    ofSetColor(150, 120, 90, static_cast<int>(40.0f + 80.0f * gain));
    ofDrawCircle(glm::vec2(ofGetWidth() * 0.5f, ofGetHeight() * 0.45f - 30.0f), radius);
    ofPopStyle();
}

void ofApp::drawCentered(ofTrueTypeFont& font, const std::string& text, float y) {
    if (text.empty()) {
        return;
    }
    if (font.isLoaded()) {
        const float width = font.stringWidth(text);
        font.drawString(text, (ofGetWidth() - width) * 0.5f, y);
    } else {
        ofDrawBitmapString(text, ofGetWidth() * 0.5f - 4.0f * static_cast<float>(text.size()), y);
    }
}
