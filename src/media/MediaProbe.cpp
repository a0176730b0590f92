#include "MediaProbe.h"
#include <QFileInfo>
#include <QImageReader>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::isImageFile(const QString& filePath) {
    static const QStringList imageExts = {"jpg", "jpeg", "png", "bmp", "gif", "webp", "tiff", "tif"};
    return imageExts.contains(QFileInfo(filePath).suffix().toLower());
}

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    if (isImageFile(filePath)) {
        QImageReader reader(filePath);
        QSize size = reader.size();
        if (!reader.canRead()) {
            m_error = QString("Unsupported image: %1").arg(filePath);
            return false;
        }
        m_info.kind = ProbedKind::Image;
        m_info.hasVideo = true;
        m_info.videoWidth = size.width();
        m_info.videoHeight = size.height();
        return true;
    }

    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = "Cannot find stream info";
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.containerFormat = QString(fmtCtx->iformat->long_name);
    m_info.duration = (fmtCtx->duration > 0)
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;

        // Embedded cover art is not a video track
        if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) continue;

        if (par->codec_type == AVMEDIA_TYPE_VIDEO && !m_info.hasVideo) {
            m_info.hasVideo = true;
            m_info.videoWidth = par->width;
            m_info.videoHeight = par->height;

            const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
            m_info.videoCodec = desc ? QString(desc->name) : "unknown";

            if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0)
                m_info.videoFps = av_q2d(stream->avg_frame_rate);
            else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0)
                m_info.videoFps = av_q2d(stream->r_frame_rate);
        }
        else if (par->codec_type == AVMEDIA_TYPE_AUDIO && !m_info.hasAudio) {
            m_info.hasAudio = true;
            m_info.audioSampleRate = par->sample_rate;
            m_info.audioChannels = par->ch_layout.nb_channels;

            const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
            m_info.audioCodec = desc ? QString(desc->name) : "unknown";
        }
    }

    avformat_close_input(&fmtCtx);

    if (m_info.hasVideo) m_info.kind = ProbedKind::Video;
    else if (m_info.hasAudio) m_info.kind = ProbedKind::Audio;
    else {
        m_error = QString("No playable streams in %1").arg(filePath);
        return false;
    }
    return true;
}
