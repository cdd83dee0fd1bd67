#pragma once

#include "ofMain.h"
#include "ofxGui.h"

#include "SessionController.h"
#include "SessionTimingConfig.h"
#include "audio/AudioEngine.h"
#include "infra/AppConfig.h"
#include "infra/HistoryStore.h"
#include "infra/PhaseTransitionLogger.h"
#include "infra/SyncWorker.h"

#include <deque>
#include <memory>
#include <string>

class ofApp : public ofBaseApp {
public:
    explicit ofApp(std::string launchUri = {});

    void setup() override;
    void update() override;
    void draw() override;
    void exit() override;

    void keyPressed(int key) override;
    void windowResized(int w, int h) override;

private:
    // GUI callbacks
    void onStartButtonPressed();
    void onPauseButtonPressed();
    void onResumeButtonPressed();
    void onAbortButtonPressed();
    void onAudioEnabledChanged(bool& enabled);
    void onVolumeChanged(float& volume);

    // Session commands; misuse is logged, never fatal
    void requestSessionStart(bhvd::SessionSource source);
    void togglePause();
    void abortSession();
    void toggleInterruption();

    // Update helpers
    void processPhaseEvents();
    void drainSessionRecords();
    void persistPendingRecords(double nowSeconds);
    void drainEngineErrors();
    void updateStatusGui();

    // Drawing helpers
    void drawSession(float nowSeconds);
    void drawBreathingRing(float nowSeconds);
    void drawCentered(ofTrueTypeFont& font, const std::string& text, float y);

    std::string launchUri_;

    bhvd::infra::AppConfig appConfig_;
    bhvd::SessionTimingConfig timingConfig_;
    std::unique_ptr<bhvd::audio::AudioEngine> audioEngine_;
    std::unique_ptr<bhvd::SessionController> sessionController_;
    std::unique_ptr<bhvd::infra::HistoryStore> historyStore_;
    std::unique_ptr<bhvd::infra::SyncWorker> syncWorker_;
    bhvd::infra::PhaseTransitionLogger phaseTransitionLogger_;

    std::deque<bhvd::SessionRecord> unpersistedRecords_;
    double nextPersistAttemptAt_ = 0.0;
    std::string currentSessionId_;
    std::string lastEngineError_;
    bool interruptionActive_ = false;

    ofTrueTypeFont displayFont_;
    ofTrueTypeFont guideFont_;

    ofxPanel controlPanel_;
    ofxButton startButton_;
    ofxButton pauseButton_;
    ofxButton resumeButton_;
    ofxButton abortButton_;
    ofParameter<bool> audioEnabledParam_;
    ofParameter<float> volumeParam_;

    ofxPanel statusPanel_;
    ofParameter<std::string> phaseParam_;
    ofParameter<std::string> remainingParam_;
    ofParameter<std::string> engineStateParam_;
    ofParameter<std::string> gainParam_;
    ofParameter<std::string> historyParam_;
    ofParameter<std::string> syncParam_;
};
