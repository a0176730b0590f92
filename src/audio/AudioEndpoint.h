#pragma once

// Receiver of mixed interleaved float PCM at the mixer rate.
class AudioEndpoint {
public:
    virtual ~AudioEndpoint() = default;
    virtual void writeAudio(const float* interleaved, int frames) = 0;
    // Drops anything buffered but not yet consumed.
    virtual void flush() {}
};
