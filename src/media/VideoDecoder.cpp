#include "VideoDecoder.h"
#include "Logging.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}

struct VideoDecoder::FFmpegContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwsContext* swsCtx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    int videoStreamIdx = -1;
    double timeBase = 0.0;
    double startOffset = 0.0;  // stream start_time in seconds
    bool eofReached = false;   // av_read_frame returned EOF
    bool flushed = false;      // drain packet sent to codec

    ~FFmpegContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        if (swsCtx) sws_freeContext(swsCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

VideoDecoder::VideoDecoder(QObject* parent) : QObject(parent) {}

VideoDecoder::~VideoDecoder() {
    close();
}

bool VideoDecoder::fail(const QString& message, int code) {
    if (code < 0) {
        char errBuf[256];
        av_strerror(code, errBuf, sizeof(errBuf));
        m_error = QString("%1 (%2)").arg(message, errBuf);
    } else {
        m_error = message;
    }
    m_ctx.reset();
    qCWarning(srMedia, "video decoder: %s", qPrintable(m_error));
    return false;
}

bool VideoDecoder::open(const QString& filePath) {
    close();
    m_ctx = std::make_unique<FFmpegContext>();

    int ret = avformat_open_input(&m_ctx->fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) return fail(QString("Cannot open %1").arg(filePath), ret);

    ret = avformat_find_stream_info(m_ctx->fmtCtx, nullptr);
    if (ret < 0) return fail("Cannot find stream info", ret);

    m_ctx->videoStreamIdx = av_find_best_stream(m_ctx->fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (m_ctx->videoStreamIdx < 0) return fail("No video stream", m_ctx->videoStreamIdx);

    m_info.hasAudio = av_find_best_stream(m_ctx->fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0) >= 0;

    AVStream* stream = m_ctx->fmtCtx->streams[m_ctx->videoStreamIdx];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) return fail("No decoder for video stream");

    m_ctx->codecCtx = avcodec_alloc_context3(codec);
    if (!m_ctx->codecCtx) return fail("Cannot allocate codec context");
    avcodec_parameters_to_context(m_ctx->codecCtx, stream->codecpar);

    ret = avcodec_open2(m_ctx->codecCtx, codec, nullptr);
    if (ret < 0) return fail("Cannot open video codec", ret);

    m_ctx->timeBase = av_q2d(stream->time_base);
    if (stream->start_time != AV_NOPTS_VALUE)
        m_ctx->startOffset = static_cast<double>(stream->start_time) * m_ctx->timeBase;

    m_info.width = m_ctx->codecCtx->width;
    m_info.height = m_ctx->codecCtx->height;
    m_info.codecName = QString(codec->name);

    if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0)
        m_info.fps = av_q2d(stream->avg_frame_rate);
    else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0)
        m_info.fps = av_q2d(stream->r_frame_rate);

    // Prefer video stream duration over container duration
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        m_info.duration = static_cast<double>(stream->duration) * m_ctx->timeBase;
    else if (m_ctx->fmtCtx->duration > 0)
        m_info.duration = static_cast<double>(m_ctx->fmtCtx->duration) / AV_TIME_BASE;

    m_ctx->frame = av_frame_alloc();
    m_ctx->packet = av_packet_alloc();

    m_ctx->swsCtx = sws_getContext(
        m_info.width, m_info.height, m_ctx->codecCtx->pix_fmt,
        m_info.width, m_info.height, AV_PIX_FMT_RGB32,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_ctx->swsCtx) return fail("Cannot create scaler");

    m_isOpen = true;
    qCDebug(srMedia, "opened %s: %dx%d %.2ffps %.3fs", qPrintable(filePath),
            m_info.width, m_info.height, m_info.fps, m_info.duration);
    return true;
}

void VideoDecoder::close() {
    m_ctx.reset();
    m_isOpen = false;
    m_info = VideoInfo{};
}

bool VideoDecoder::decodeNextFrame(QImage& image, double& pts) {
    if (!m_isOpen || !m_ctx) return false;

    while (true) {
        // Buffered frames first (B-frame reordering)
        int ret = avcodec_receive_frame(m_ctx->codecCtx, m_ctx->frame);
        if (ret == 0) {
            QImage out(m_info.width, m_info.height, QImage::Format_RGB32);
            uint8_t* dst[1] = { out.bits() };
            int dstStride[1] = { static_cast<int>(out.bytesPerLine()) };
            sws_scale(m_ctx->swsCtx, m_ctx->frame->data, m_ctx->frame->linesize,
                      0, m_info.height, dst, dstStride);

            int64_t ts = m_ctx->frame->best_effort_timestamp;
            if (ts == AV_NOPTS_VALUE) ts = m_ctx->frame->pts;
            pts = (ts != AV_NOPTS_VALUE)
                ? static_cast<double>(ts) * m_ctx->timeBase - m_ctx->startOffset
                : 0.0;
            image = out;
            av_frame_unref(m_ctx->frame);
            return true;
        }

        if (ret != AVERROR(EAGAIN))
            return false;   // EOF or decode error

        if (m_ctx->eofReached) {
            if (m_ctx->flushed) return false;
            m_ctx->flushed = true;
            avcodec_send_packet(m_ctx->codecCtx, nullptr);
            continue;
        }

        ret = av_read_frame(m_ctx->fmtCtx, m_ctx->packet);
        if (ret < 0) {
            m_ctx->eofReached = true;
            continue;
        }

        if (m_ctx->packet->stream_index == m_ctx->videoStreamIdx) {
            ret = avcodec_send_packet(m_ctx->codecCtx, m_ctx->packet);
            if (ret < 0 && ret != AVERROR(EAGAIN))
                qCDebug(srMedia, "dropping undecodable packet");
        }
        av_packet_unref(m_ctx->packet);
    }
}

bool VideoDecoder::seek(double seconds) {
    if (!m_isOpen || !m_ctx) return false;

    AVStream* stream = m_ctx->fmtCtx->streams[m_ctx->videoStreamIdx];
    int64_t target = static_cast<int64_t>(qMax(0.0, seconds) / m_ctx->timeBase);
    if (stream->start_time != AV_NOPTS_VALUE) target += stream->start_time;

    int ret = av_seek_frame(m_ctx->fmtCtx, m_ctx->videoStreamIdx, target, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Seek to %1s failed (%2)").arg(seconds).arg(errBuf);
        return false;
    }

    avcodec_flush_buffers(m_ctx->codecCtx);
    m_ctx->eofReached = false;
    m_ctx->flushed = false;
    return true;
}
