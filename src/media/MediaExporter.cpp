#include "MediaExporter.h"
#include "Logging.h"
#include <algorithm>
#include <cstdio>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
#include <libswresample/swresample.h>
}

namespace {
    constexpr int IoBufferSize = 64 * 1024;
    constexpr int DefaultAudioFrameSize = 1024;
}

// AVIO callbacks over the in-memory output. Muxers seek back to patch
// headers (mp4 moov, matroska cues), so writes land at the cursor.
struct ChunkWriter {
#if LIBAVFORMAT_VERSION_MAJOR >= 61
    static int write(void* opaque, const uint8_t* buf, int size) {
#else
    static int write(void* opaque, uint8_t* buf, int size) {
#endif
        auto* self = static_cast<MediaExporter*>(opaque);
        int64_t end = self->m_writePos + size;
        if (end > self->m_output.size())
            self->m_output.resize(static_cast<qsizetype>(end));
        std::copy(buf, buf + size, self->m_output.data() + self->m_writePos);
        self->m_writePos = end;
        return size;
    }

    static int64_t seek(void* opaque, int64_t offset, int whence) {
        auto* self = static_cast<MediaExporter*>(opaque);
        int64_t size = self->m_output.size();
        switch (whence & ~AVSEEK_FORCE) {
        case AVSEEK_SIZE: return size;
        case SEEK_SET: break;
        case SEEK_CUR: offset += self->m_writePos; break;
        case SEEK_END: offset += size; break;
        default: return AVERROR(EINVAL);
        }
        if (offset < 0) return AVERROR(EINVAL);
        self->m_writePos = offset;
        return offset;
    }
};

MediaExporter::MediaExporter(QObject* parent) : QObject(parent) {}

MediaExporter::~MediaExporter() {
    release();
}

bool MediaExporter::fail(const QString& what, int err) {
    if (err < 0) {
        char errBuf[256];
        av_strerror(err, errBuf, sizeof(errBuf));
        m_error = QString("%1: %2").arg(what, errBuf);
    } else {
        m_error = what;
    }
    qCWarning(srExport) << "recorder:" << m_error;
    release();
    return false;
}

bool MediaExporter::start(const RecorderSettings& settings) {
    release();
    m_settings = settings;
    m_error.clear();
    m_output.clear();
    m_writePos = 0;
    m_videoFrames = 0;
    m_audioSamples = 0;

    if (!openOutput()) return false;
    if (!openVideoEncoder()) return false;
    if (!openAudioEncoder()) return false;

    int ret = avformat_write_header(m_fmtCtx, nullptr);
    if (ret < 0) return fail("Cannot write stream header", ret);

    m_packet = av_packet_alloc();
    m_recording = true;
    qCInfo(srExport) << "recording" << m_settings.profile.description()
                     << m_settings.width << "x" << m_settings.height << "@" << m_settings.fps;
    return true;
}

bool MediaExporter::openOutput() {
    QByteArray muxer = m_settings.profile.container.toUtf8();
    int ret = avformat_alloc_output_context2(&m_fmtCtx, nullptr, muxer.constData(), nullptr);
    if (ret < 0 || !m_fmtCtx) return fail(QString("No muxer for %1").arg(m_settings.profile.container), ret);

    auto* ioBuffer = static_cast<unsigned char*>(av_malloc(IoBufferSize));
    if (!ioBuffer) return fail("Out of memory");
    m_ioCtx = avio_alloc_context(ioBuffer, IoBufferSize, 1, this, nullptr,
                                 &ChunkWriter::write, &ChunkWriter::seek);
    if (!m_ioCtx) {
        av_free(ioBuffer);
        return fail("Cannot allocate output I/O");
    }
    m_fmtCtx->pb = m_ioCtx;
    m_fmtCtx->flags |= AVFMT_FLAG_CUSTOM_IO;
    return true;
}

bool MediaExporter::openVideoEncoder() {
    const AVCodec* codec = avcodec_find_encoder_by_name(m_settings.profile.videoEncoder.toUtf8().constData());
    if (!codec) return fail(QString("Video encoder %1 not available").arg(m_settings.profile.videoEncoder));

    m_videoStream = avformat_new_stream(m_fmtCtx, nullptr);
    m_videoEnc = avcodec_alloc_context3(codec);
    if (!m_videoStream || !m_videoEnc) return fail("Cannot allocate video stream");

    bool mjpeg = codec->id == AV_CODEC_ID_MJPEG;
    m_videoEnc->width = m_settings.width;
    m_videoEnc->height = m_settings.height;
    m_videoEnc->pix_fmt = mjpeg ? AV_PIX_FMT_YUVJ420P : AV_PIX_FMT_YUV420P;
    m_videoEnc->time_base = AVRational{1, m_settings.fps};
    m_videoEnc->framerate = AVRational{m_settings.fps, 1};
    m_videoEnc->bit_rate = m_settings.videoBitrate;
    m_videoEnc->gop_size = m_settings.fps * 2;
    if (m_fmtCtx->oformat->flags & AVFMT_GLOBALHEADER)
        m_videoEnc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    AVDictionary* opts = nullptr;
    if (m_settings.profile.videoEncoder == "libx264") {
        av_dict_set(&opts, "preset", "veryfast", 0);
    } else if (m_settings.profile.videoEncoder == "libvpx") {
        av_dict_set(&opts, "deadline", "realtime", 0);
        av_dict_set(&opts, "cpu-used", "8", 0);
    }
    int ret = avcodec_open2(m_videoEnc, codec, &opts);
    av_dict_free(&opts);
    if (ret < 0) return fail("Cannot open video encoder", ret);

    ret = avcodec_parameters_from_context(m_videoStream->codecpar, m_videoEnc);
    if (ret < 0) return fail("Cannot copy video parameters", ret);
    m_videoStream->time_base = m_videoEnc->time_base;

    m_videoFrame = av_frame_alloc();
    if (!m_videoFrame) return fail("Out of memory");
    m_videoFrame->format = m_videoEnc->pix_fmt;
    m_videoFrame->width = m_settings.width;
    m_videoFrame->height = m_settings.height;
    ret = av_frame_get_buffer(m_videoFrame, 0);
    if (ret < 0) return fail("Cannot allocate video frame", ret);
    return true;
}

bool MediaExporter::openAudioEncoder() {
    const AVCodec* codec = avcodec_find_encoder_by_name(m_settings.profile.audioEncoder.toUtf8().constData());
    if (!codec) return fail(QString("Audio encoder %1 not available").arg(m_settings.profile.audioEncoder));

    AVSampleFormat sampleFmt = av_get_sample_fmt(m_settings.profile.audioSampleFormat.toUtf8().constData());
    if (sampleFmt == AV_SAMPLE_FMT_NONE)
        return fail(QString("Unknown sample format %1").arg(m_settings.profile.audioSampleFormat));

    m_audioStream = avformat_new_stream(m_fmtCtx, nullptr);
    m_audioEnc = avcodec_alloc_context3(codec);
    if (!m_audioStream || !m_audioEnc) return fail("Cannot allocate audio stream");

    m_audioEnc->sample_rate = m_settings.sampleRate;
    av_channel_layout_default(&m_audioEnc->ch_layout, m_settings.channels);
    m_audioEnc->sample_fmt = sampleFmt;
    m_audioEnc->time_base = AVRational{1, m_settings.sampleRate};
    m_audioEnc->bit_rate = m_settings.audioBitrate;
    // The native opus encoder is still flagged experimental
    if (m_settings.profile.audioEncoder == "opus")
        m_audioEnc->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;
    if (m_fmtCtx->oformat->flags & AVFMT_GLOBALHEADER)
        m_audioEnc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    int ret = avcodec_open2(m_audioEnc, codec, nullptr);
    if (ret < 0) return fail("Cannot open audio encoder", ret);

    ret = avcodec_parameters_from_context(m_audioStream->codecpar, m_audioEnc);
    if (ret < 0) return fail("Cannot copy audio parameters", ret);
    m_audioStream->time_base = m_audioEnc->time_base;

    m_audioFrameSize = m_audioEnc->frame_size > 0 ? m_audioEnc->frame_size : DefaultAudioFrameSize;

    AVChannelLayout inLayout;
    av_channel_layout_default(&inLayout, m_settings.channels);
    ret = swr_alloc_set_opts2(&m_swrCtx, &m_audioEnc->ch_layout, m_audioEnc->sample_fmt,
                              m_audioEnc->sample_rate, &inLayout, AV_SAMPLE_FMT_FLT,
                              m_settings.sampleRate, 0, nullptr);
    av_channel_layout_uninit(&inLayout);
    if (ret < 0) return fail("Cannot configure resampler", ret);
    ret = swr_init(m_swrCtx);
    if (ret < 0) return fail("Cannot init resampler", ret);

    m_fifo = av_audio_fifo_alloc(m_audioEnc->sample_fmt, m_settings.channels, m_audioFrameSize * 4);
    m_audioFrame = av_frame_alloc();
    if (!m_fifo || !m_audioFrame) return fail("Out of memory");
    return true;
}

bool MediaExporter::writeVideoFrame(const QImage& frame) {
    if (!m_recording) return fail("Recorder not started");

    QImage src = frame.format() == QImage::Format_RGB32 ? frame : frame.convertToFormat(QImage::Format_RGB32);
    m_swsCtx = sws_getCachedContext(m_swsCtx, src.width(), src.height(), AV_PIX_FMT_RGB32,
                                    m_settings.width, m_settings.height, m_videoEnc->pix_fmt,
                                    SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_swsCtx) return fail("Cannot create scaler");

    int ret = av_frame_make_writable(m_videoFrame);
    if (ret < 0) return fail("Video frame not writable", ret);

    const uint8_t* srcData[4] = {src.constBits(), nullptr, nullptr, nullptr};
    int srcStride[4] = {static_cast<int>(src.bytesPerLine()), 0, 0, 0};
    sws_scale(m_swsCtx, srcData, srcStride, 0, src.height(), m_videoFrame->data, m_videoFrame->linesize);

    m_videoFrame->pts = m_videoFrames++;
    return sendFrame(m_videoEnc, m_videoStream, m_videoFrame);
}

bool MediaExporter::writeAudio(const float* interleaved, int frames) {
    if (!m_recording) return fail("Recorder not started");
    if (frames <= 0) return true;

    int capacity = swr_get_out_samples(m_swrCtx, frames);
    if (capacity <= 0) return true;

    uint8_t** converted = nullptr;
    int ret = av_samples_alloc_array_and_samples(&converted, nullptr, m_settings.channels,
                                                 capacity, m_audioEnc->sample_fmt, 0);
    if (ret < 0) return fail("Cannot allocate audio buffer", ret);

    const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(interleaved)};
    int outCount = swr_convert(m_swrCtx, converted, capacity, in, frames);
    if (outCount > 0) {
        ret = av_audio_fifo_write(m_fifo, reinterpret_cast<void**>(converted), outCount);
    }
    av_freep(&converted[0]);
    av_freep(&converted);

    if (outCount < 0) return fail("Audio conversion failed", outCount);
    if (ret < 0) return fail("Audio FIFO write failed", ret);

    return encodeAudioFromFifo(false);
}

bool MediaExporter::encodeAudioFromFifo(bool flush) {
    while (av_audio_fifo_size(m_fifo) >= m_audioFrameSize
           || (flush && av_audio_fifo_size(m_fifo) > 0)) {
        int n = std::min(av_audio_fifo_size(m_fifo), m_audioFrameSize);

        av_frame_unref(m_audioFrame);
        m_audioFrame->nb_samples = n;
        m_audioFrame->format = m_audioEnc->sample_fmt;
        m_audioFrame->sample_rate = m_audioEnc->sample_rate;
        int ret = av_channel_layout_copy(&m_audioFrame->ch_layout, &m_audioEnc->ch_layout);
        if (ret < 0) return fail("Cannot set channel layout", ret);
        ret = av_frame_get_buffer(m_audioFrame, 0);
        if (ret < 0) return fail("Cannot allocate audio frame", ret);

        if (av_audio_fifo_read(m_fifo, reinterpret_cast<void**>(m_audioFrame->data), n) < n)
            return fail("Audio FIFO underrun");

        m_audioFrame->pts = m_audioSamples;
        m_audioSamples += n;
        if (!sendFrame(m_audioEnc, m_audioStream, m_audioFrame)) return false;
    }
    return true;
}

bool MediaExporter::sendFrame(AVCodecContext* enc, AVStream* stream, AVFrame* frame) {
    int ret = avcodec_send_frame(enc, frame);
    if (ret < 0 && !(frame == nullptr && ret == AVERROR_EOF))
        return fail("Encoder rejected frame", ret);

    while (true) {
        ret = avcodec_receive_packet(enc, m_packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) return fail("Encoding failed", ret);

        m_packet->stream_index = stream->index;
        av_packet_rescale_ts(m_packet, enc->time_base, stream->time_base);
        ret = av_interleaved_write_frame(m_fmtCtx, m_packet);
        if (ret < 0) return fail("Cannot write packet", ret);
    }
    return true;
}

bool MediaExporter::finish(QByteArray& output) {
    if (!m_recording) return fail("Recorder not started");

    if (!encodeAudioFromFifo(true)) return false;
    if (!sendFrame(m_videoEnc, m_videoStream, nullptr)) return false;
    if (!sendFrame(m_audioEnc, m_audioStream, nullptr)) return false;

    int ret = av_write_trailer(m_fmtCtx);
    if (ret < 0) return fail("Cannot finalize stream", ret);
    avio_flush(m_ioCtx);

    output = m_output;
    qCInfo(srExport) << "recorder finished:" << m_videoFrames << "frames,"
                     << m_audioSamples << "samples," << m_output.size() << "bytes";
    release();
    m_output.clear();
    m_writePos = 0;
    return true;
}

void MediaExporter::abort() {
    release();
    m_output.clear();
    m_writePos = 0;
}

void MediaExporter::release() {
    m_recording = false;
    if (m_packet) av_packet_free(&m_packet);
    if (m_videoFrame) av_frame_free(&m_videoFrame);
    if (m_audioFrame) av_frame_free(&m_audioFrame);
    if (m_fifo) { av_audio_fifo_free(m_fifo); m_fifo = nullptr; }
    if (m_swrCtx) swr_free(&m_swrCtx);
    if (m_swsCtx) { sws_freeContext(m_swsCtx); m_swsCtx = nullptr; }
    if (m_videoEnc) avcodec_free_context(&m_videoEnc);
    if (m_audioEnc) avcodec_free_context(&m_audioEnc);
    if (m_fmtCtx) {
        avformat_free_context(m_fmtCtx);
        m_fmtCtx = nullptr;
    }
    if (m_ioCtx) {
        av_freep(&m_ioCtx->buffer);
        avio_context_free(&m_ioCtx);
    }
    m_videoStream = nullptr;
    m_audioStream = nullptr;
}
