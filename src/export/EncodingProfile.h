#pragma once

#include <QString>
#include <functional>
#include <vector>

// Container plus the encoders the recorder will open for it.
struct EncodingProfile {
    QString container;          // FFmpeg muxer name
    QString extension;
    QString mimeType;
    QString videoEncoder;
    QString audioEncoder;
    QString audioSampleFormat;  // av_get_sample_fmt name
    bool isFallback = false;

    QString description() const;
};

using EncoderProbe = std::function<bool(const QString& encoderName)>;

namespace EncodingProfiles {
    // Preference order, most compatible first. The last entry only uses
    // encoders built into FFmpeg itself.
    std::vector<EncodingProfile> candidates();
    EncodingProfile fallback();

    // First candidate whose encoders all pass the probe, else the fallback.
    EncodingProfile negotiate(const EncoderProbe& probe);

    // Probe against the linked libavcodec.
    bool ffmpegHasEncoder(const QString& encoderName);
}
