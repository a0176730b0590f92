#pragma once

#include <QMutex>
#include <vector>
#include "AudioEndpoint.h"

// Export destination: accumulates mixed PCM until the recorder drains it.
class ExportAudioSink : public AudioEndpoint {
public:
    explicit ExportAudioSink(int channels);

    void writeAudio(const float* interleaved, int frames) override;
    void flush() override;

    // Moves all accumulated samples out.
    std::vector<float> takeSamples();
    int bufferedFrames() const;
    int channels() const { return m_channels; }

private:
    int m_channels;
    std::vector<float> m_samples;
    mutable QMutex m_mutex;
};
