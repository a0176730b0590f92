#pragma once

#include <QByteArray>
#include <QImage>
#include <QString>
#include "EncodingProfile.h"

struct RecorderSettings {
    EncodingProfile profile;
    int width = 1280;
    int height = 720;
    int fps = 30;
    int videoBitrate = 5000000;
    int audioBitrate = 128000;
    int sampleRate = 48000;
    int channels = 2;
};

// Encodes canvas frames at a fixed rate plus interleaved float PCM into an
// in-memory stream of encoded chunks.
class StreamRecorder {
public:
    virtual ~StreamRecorder() = default;

    virtual bool start(const RecorderSettings& settings) = 0;
    // Appends the next frame of the fixed-rate video stream.
    virtual bool writeVideoFrame(const QImage& frame) = 0;
    virtual bool writeAudio(const float* interleaved, int frames) = 0;
    // Flushes encoders and hands back every chunk as one buffer.
    virtual bool finish(QByteArray& output) = 0;
    // Drops everything; start() may be called again.
    virtual void abort() = 0;

    virtual QString errorString() const = 0;
};
