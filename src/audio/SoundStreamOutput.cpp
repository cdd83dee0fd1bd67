#include "SoundStreamOutput.h"

#include "ofLog.h"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace bhvd::audio {

SoundStreamOutput::SoundStreamOutput(std::string preferredDeviceName)
    : preferredDeviceName_(std::move(preferredDeviceName)) {}

SoundStreamOutput::~SoundStreamOutput() {
    close();
}

bool SoundStreamOutput::selectDevice(ofSoundStreamSettings& settings) {
    std::vector<ofSoundDevice> outputs;
    try {
        for (const auto& device : soundStream_.getDeviceList()) {
            if (device.outputChannels >= 2) {
                outputs.push_back(device);
            }
        }
    } catch (const std::exception& ex) {
        ofLogError("SoundStreamOutput") << "Device enumeration failed: " << ex.what();
        return false;
    }

    if (outputs.empty()) {
        ofLogError("SoundStreamOutput") << "No stereo output device detected";
        return false;
    }

    auto chosen = outputs.begin();
    if (!preferredDeviceName_.empty()) {
        const auto match = std::find_if(outputs.begin(), outputs.end(), [this](const ofSoundDevice& device) {
            return device.name == preferredDeviceName_;
        });
        if (match != outputs.end()) {
            chosen = match;
        } else {
            ofLogWarning("SoundStreamOutput") << "Output device '" << preferredDeviceName_
                                              << "' not found, falling back to '" << chosen->name << "'";
        }
    } else {
        const auto defaultDevice = std::find_if(outputs.begin(), outputs.end(), [](const ofSoundDevice& device) {
            return device.isDefaultOutput;
        });
        if (defaultDevice != outputs.end()) {
            chosen = defaultDevice;
        }
    }

    settings.setOutDevice(*chosen);
    activeDeviceName_ = chosen->name;
    return true;
}

bool SoundStreamOutput::open(const AudioOutputSettings& settings, ofBaseSoundOutput* listener) {
    if (open_) {
        return true;
    }

    ofSoundStreamSettings streamSettings;
    streamSettings.sampleRate = static_cast<unsigned int>(settings.sampleRate);
    streamSettings.bufferSize = settings.bufferSize;
    streamSettings.numBuffers = settings.numBuffers;
    streamSettings.numInputChannels = 0;
    streamSettings.numOutputChannels = settings.numChannels;
    streamSettings.setOutListener(listener);

    if (!selectDevice(streamSettings)) {
        return false;
    }

    try {
        if (!soundStream_.setup(streamSettings)) {
            ofLogError("SoundStreamOutput") << "Sound stream setup rejected for '" << activeDeviceName_ << "'";
            return false;
        }
        // setup() starts the stream; keep it silent until start() is requested.
        soundStream_.stop();
    } catch (const std::exception& ex) {
        ofLogError("SoundStreamOutput") << "Audio device initialisation failed: " << ex.what();
        return false;
    }

    open_ = true;
    running_ = false;
    ofLogNotice("SoundStreamOutput") << "Opened '" << activeDeviceName_ << "' at " << settings.sampleRate
                                     << " Hz, " << settings.numChannels << "ch, buffer " << settings.bufferSize;
    return true;
}

bool SoundStreamOutput::start() {
    if (!open_) {
        return false;
    }
    if (running_) {
        return true;
    }
    try {
        soundStream_.start();
    } catch (const std::exception& ex) {
        ofLogError("SoundStreamOutput") << "Sound stream start failed: " << ex.what();
        return false;
    }
    running_ = true;
    return true;
}

void SoundStreamOutput::stop() {
    if (!running_) {
        return;
    }
    try {
        soundStream_.stop();
    } catch (const std::exception& ex) {
        ofLogError("SoundStreamOutput") << "Sound stream stop failed: " << ex.what();
    }
    running_ = false;
}

void SoundStreamOutput::close() {
    if (!open_) {
        return;
    }
    stop();
    try {
        soundStream_.close();
    } catch (const std::exception& ex) {
        ofLogError("SoundStreamOutput") << "Sound stream shutdown failed: " << ex.what();
    }
    open_ = false;
}

std::string SoundStreamOutput::describe() const {
    return activeDeviceName_.empty() ? std::string("none") : activeDeviceName_;
}

} // namespace bhvd::audio
