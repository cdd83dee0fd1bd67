#pragma once

#include "AudioOutput.h"

#include "ofSoundStream.h"

#include <string>

namespace bhvd::audio {

/// AudioOutput backed by ofSoundStream. An empty device name picks the first device
/// offering at least stereo output.
class SoundStreamOutput : public AudioOutput {
public:
    explicit SoundStreamOutput(std::string preferredDeviceName = {});
    ~SoundStreamOutput() override;

    SoundStreamOutput(const SoundStreamOutput&) = delete;
    SoundStreamOutput& operator=(const SoundStreamOutput&) = delete;

    bool open(const AudioOutputSettings& settings, ofBaseSoundOutput* listener) override;
    bool start() override;
    void stop() override;
    void close() override;

    bool isOpen() const override { return open_; }
    bool isRunning() const override { return running_; }
    std::string describe() const override;

private:
    bool selectDevice(ofSoundStreamSettings& settings);

    std::string preferredDeviceName_;
    std::string activeDeviceName_;
    ofSoundStream soundStream_;
    bool open_ = false;
    bool running_ = false;
};

} // namespace bhvd::audio
