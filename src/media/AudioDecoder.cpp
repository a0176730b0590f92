#include "AudioDecoder.h"
#include "Logging.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

struct AudioDecoder::FFmpegAudioContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwrContext* swrCtx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    int audioStreamIdx = -1;

    ~FFmpegAudioContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        if (swrCtx) swr_free(&swrCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

AudioDecoder::AudioDecoder(QObject* parent) : QObject(parent) {}
AudioDecoder::~AudioDecoder() { close(); }

bool AudioDecoder::fail(const QString& message, int code) {
    if (code < 0) {
        char errBuf[256];
        av_strerror(code, errBuf, sizeof(errBuf));
        m_error = QString("%1 (%2)").arg(message, errBuf);
    } else {
        m_error = message;
    }
    m_ctx.reset();
    return false;
}

bool AudioDecoder::open(const QString& filePath, int outSampleRate, int outChannels) {
    close();
    m_outRate = outSampleRate;
    m_outChannels = outChannels;
    m_ctx = std::make_unique<FFmpegAudioContext>();

    int ret = avformat_open_input(&m_ctx->fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) return fail(QString("Cannot open %1").arg(filePath), ret);

    ret = avformat_find_stream_info(m_ctx->fmtCtx, nullptr);
    if (ret < 0) return fail("Cannot find stream info", ret);

    m_ctx->audioStreamIdx = av_find_best_stream(m_ctx->fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (m_ctx->audioStreamIdx < 0) return fail("No audio stream", m_ctx->audioStreamIdx);

    AVStream* stream = m_ctx->fmtCtx->streams[m_ctx->audioStreamIdx];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) return fail("No decoder for audio stream");

    m_ctx->codecCtx = avcodec_alloc_context3(codec);
    if (!m_ctx->codecCtx) return fail("Cannot allocate codec context");
    avcodec_parameters_to_context(m_ctx->codecCtx, stream->codecpar);

    ret = avcodec_open2(m_ctx->codecCtx, codec, nullptr);
    if (ret < 0) return fail("Cannot open audio codec", ret);

    m_info.sampleRate = m_ctx->codecCtx->sample_rate;
    m_info.channels = m_ctx->codecCtx->ch_layout.nb_channels;
    m_info.codecName = QString(codec->name);
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        m_info.duration = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    else if (m_ctx->fmtCtx->duration > 0)
        m_info.duration = static_cast<double>(m_ctx->fmtCtx->duration) / AV_TIME_BASE;

    AVChannelLayout outLayout;
    av_channel_layout_default(&outLayout, m_outChannels);
    ret = swr_alloc_set_opts2(&m_ctx->swrCtx,
        &outLayout, AV_SAMPLE_FMT_FLT, m_outRate,
        &m_ctx->codecCtx->ch_layout, m_ctx->codecCtx->sample_fmt, m_info.sampleRate,
        0, nullptr);
    av_channel_layout_uninit(&outLayout);
    if (ret < 0 || !m_ctx->swrCtx) return fail("Cannot configure resampler", ret);

    ret = swr_init(m_ctx->swrCtx);
    if (ret < 0) return fail("Cannot init resampler", ret);

    m_ctx->frame = av_frame_alloc();
    m_ctx->packet = av_packet_alloc();

    m_isOpen = true;
    return true;
}

void AudioDecoder::close() {
    m_ctx.reset();
    m_isOpen = false;
    m_info = AudioInfo{};
}

bool AudioDecoder::decodeAll(std::vector<float>& pcm, double maxSeconds) {
    if (!m_isOpen || !m_ctx) {
        m_error = "Decoder not open";
        return false;
    }

    int64_t maxFrames = maxSeconds > 0 ? static_cast<int64_t>(maxSeconds * m_outRate) : -1;
    int64_t totalFrames = 0;
    bool eof = false;

    auto convertFrame = [&](const AVFrame* frame) {
        int outCapacity = swr_get_out_samples(m_ctx->swrCtx, frame ? frame->nb_samples : 0);
        if (outCapacity <= 0) return 0;
        size_t offset = pcm.size();
        pcm.resize(offset + static_cast<size_t>(outCapacity) * m_outChannels);
        uint8_t* outPtr = reinterpret_cast<uint8_t*>(pcm.data() + offset);
        int converted = swr_convert(m_ctx->swrCtx, &outPtr, outCapacity,
            frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
            frame ? frame->nb_samples : 0);
        if (converted < 0) converted = 0;
        pcm.resize(offset + static_cast<size_t>(converted) * m_outChannels);
        return converted;
    };

    while (!eof) {
        int ret = av_read_frame(m_ctx->fmtCtx, m_ctx->packet);
        if (ret < 0) {
            eof = true;
            avcodec_send_packet(m_ctx->codecCtx, nullptr);
        } else {
            if (m_ctx->packet->stream_index != m_ctx->audioStreamIdx) {
                av_packet_unref(m_ctx->packet);
                continue;
            }
            ret = avcodec_send_packet(m_ctx->codecCtx, m_ctx->packet);
            av_packet_unref(m_ctx->packet);
            if (ret < 0 && ret != AVERROR(EAGAIN)) continue;
        }

        while (avcodec_receive_frame(m_ctx->codecCtx, m_ctx->frame) >= 0) {
            totalFrames += convertFrame(m_ctx->frame);
            av_frame_unref(m_ctx->frame);
            if (maxFrames > 0 && totalFrames >= maxFrames) {
                pcm.resize(static_cast<size_t>(maxFrames) * m_outChannels);
                return true;
            }
        }
    }

    // Resampler tail
    totalFrames += convertFrame(nullptr);
    qCDebug(srMedia, "decoded %lld audio frames", static_cast<long long>(totalFrames));
    return true;
}

bool AudioDecoder::seek(double seconds) {
    if (!m_isOpen || !m_ctx) return false;

    int64_t timestamp = static_cast<int64_t>(seconds * AV_TIME_BASE);
    int ret = av_seek_frame(m_ctx->fmtCtx, -1, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        m_error = "Seek failed";
        return false;
    }

    avcodec_flush_buffers(m_ctx->codecCtx);
    swr_init(m_ctx->swrCtx);
    return true;
}
