#include "EncodingProfile.h"
#include "Logging.h"

extern "C" {
#include <libavcodec/avcodec.h>
}

QString EncodingProfile::description() const {
    return QString("%1 (%2 + %3)").arg(container, videoEncoder, audioEncoder);
}

namespace EncodingProfiles {

std::vector<EncodingProfile> candidates() {
    return {
        {"mp4", "mp4", "video/mp4", "libx264", "aac", "fltp", false},
        {"mp4", "mp4", "video/mp4", "libopenh264", "aac", "fltp", false},
        {"webm", "webm", "video/webm", "libvpx", "libopus", "flt", false},
        {"webm", "webm", "video/webm", "libvpx", "opus", "fltp", false},
        fallback(),
    };
}

EncodingProfile fallback() {
    return {"matroska", "mkv", "video/x-matroska", "mjpeg", "pcm_s16le", "s16", true};
}

EncodingProfile negotiate(const EncoderProbe& probe) {
    for (const auto& profile : candidates()) {
        if (profile.isFallback) break;
        if (probe(profile.videoEncoder) && probe(profile.audioEncoder)) {
            qCInfo(srExport) << "negotiated" << profile.description();
            return profile;
        }
    }
    qCInfo(srExport) << "no preferred encoder available, using" << fallback().description();
    return fallback();
}

bool ffmpegHasEncoder(const QString& encoderName) {
    return avcodec_find_encoder_by_name(encoderName.toUtf8().constData()) != nullptr;
}

} // namespace EncodingProfiles
