#pragma once

#include <cstddef>
#include <string>

class ofBaseSoundOutput;

namespace bhvd::audio {

struct AudioOutputSettings {
    double sampleRate = 48000.0;
    std::size_t bufferSize = 512;
    std::size_t numChannels = 2;
    std::size_t numBuffers = 4;
};

/// Audio device seam. open() acquires the device, start()/stop() gate the callback
/// pulling from the listener, close() releases everything.
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual bool open(const AudioOutputSettings& settings, ofBaseSoundOutput* listener) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual bool isRunning() const = 0;
    virtual std::string describe() const = 0;
};

} // namespace bhvd::audio
