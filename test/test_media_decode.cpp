#include <cassert>
#include <cstdio>
#include <cmath>
#include <vector>
#include <QColor>
#include <QFile>
#include <QImage>
#include <QTemporaryDir>
#include "media/MediaProbe.h"
#include "media/VideoDecoder.h"
#include "media/AudioDecoder.h"
#include "media/MediaExporter.h"
#include "media/FrameQueue.h"
#include "media/VideoPlaybackEngine.h"
#include <QElapsedTimer>
#include <QThread>

static const int Width = 320;
static const int Height = 180;
static const int Fps = 30;
static const int Rate = 48000;
static const double Seconds = 2.0;

// Encodes a red-then-green clip with a 440 Hz tone. Empty when this FFmpeg
// build has no usable encoders.
static QString writeTestClip(const QTemporaryDir& dir) {
    RecorderSettings settings;
    settings.profile = EncodingProfiles::negotiate(EncodingProfiles::ffmpegHasEncoder);
    settings.width = Width;
    settings.height = Height;
    settings.fps = Fps;
    settings.videoBitrate = 1000000;
    settings.sampleRate = Rate;
    settings.channels = 2;

    MediaExporter exporter;
    if (!exporter.start(settings)) {
        printf("  encoder unavailable: %s\n", exporter.errorString().toUtf8().constData());
        return QString();
    }

    const int frames = static_cast<int>(Seconds * Fps);
    const int samplesPerFrame = Rate / Fps;
    std::vector<float> pcm(samplesPerFrame * 2);
    long long sampleIndex = 0;

    for (int i = 0; i < frames; ++i) {
        QImage image(Width, Height, QImage::Format_RGB32);
        image.fill(i < frames / 2 ? QColor(Qt::red) : QColor(Qt::green));
        assert(exporter.writeVideoFrame(image));

        for (int s = 0; s < samplesPerFrame; ++s, ++sampleIndex) {
            float v = 0.5f * static_cast<float>(std::sin(2.0 * M_PI * 440.0 * sampleIndex / Rate));
            pcm[s * 2] = v;
            pcm[s * 2 + 1] = v;
        }
        assert(exporter.writeAudio(pcm.data(), samplesPerFrame));
    }

    QByteArray output;
    assert(exporter.finish(output));
    assert(!output.isEmpty());
    assert(exporter.videoFramesWritten() == frames);

    QString path = dir.filePath("clip." + settings.profile.extension);
    QFile file(path);
    assert(file.open(QIODevice::WriteOnly));
    file.write(output);
    file.close();
    printf("  wrote %s (%lld bytes, %s)\n", path.toUtf8().constData(),
           static_cast<long long>(output.size()),
           settings.profile.description().toUtf8().constData());
    return path;
}

void test_media_probe(const QString& clip) {
    printf("=== test_media_probe ===\n");

    MediaProbe probe;
    bool ok = probe.probe(clip);
    if (!ok) {
        printf("FAIL: probe failed - %s\n", probe.errorString().toUtf8().constData());
        assert(false);
    }

    const MediaInfo& info = probe.info();
    printf("  Container: %s, duration %.3f s, video %dx%d @ %.2f fps\n",
           info.containerFormat.toUtf8().constData(), info.duration,
           info.videoWidth, info.videoHeight, info.videoFps);

    assert(info.kind == ProbedKind::Video);
    assert(info.hasVideo && info.hasAudio);
    assert(info.videoWidth == Width);
    assert(info.videoHeight == Height);
    assert(std::abs(info.duration - Seconds) < 0.25);

    assert(!probe.probe("/nonexistent/clip.mp4"));
    assert(!probe.errorString().isEmpty());
    printf("PASS: test_media_probe\n\n");
}

void test_image_probe(const QTemporaryDir& dir) {
    printf("=== test_image_probe ===\n");

    QString path = dir.filePath("still.png");
    QImage image(64, 48, QImage::Format_RGB32);
    image.fill(Qt::blue);
    assert(image.save(path));

    MediaProbe probe;
    assert(probe.probe(path));
    assert(probe.info().kind == ProbedKind::Image);
    assert(probe.info().videoWidth == 64);
    assert(probe.info().videoHeight == 48);
    assert(MediaProbe::isImageFile("photo.JPG"));
    assert(!MediaProbe::isImageFile("clip.mp4"));
    printf("PASS: test_image_probe\n\n");
}

void test_video_decode(const QString& clip) {
    printf("=== test_video_decode ===\n");

    VideoDecoder decoder;
    bool ok = decoder.open(clip);
    if (!ok) {
        printf("FAIL: cannot open video - %s\n", decoder.errorString().toUtf8().constData());
        assert(false);
    }
    assert(decoder.info().width == Width);
    assert(decoder.info().height == Height);

    QImage frame;
    double pts = -1.0;
    double lastPts = -1.0;
    for (int i = 0; i < 10; ++i) {
        assert(decoder.decodeNextFrame(frame, pts));
        assert(frame.size() == QSize(Width, Height));
        assert(pts >= lastPts);
        lastPts = pts;
    }
    QColor first = frame.pixelColor(Width / 2, Height / 2);
    assert(first.red() > 200 && first.green() < 60);

    // Second half is green
    assert(decoder.seek(1.5));
    bool sawGreen = false;
    while (decoder.decodeNextFrame(frame, pts)) {
        assert(pts <= Seconds + 0.1);
        QColor c = frame.pixelColor(Width / 2, Height / 2);
        if (pts >= 1.1 && c.green() > 200 && c.red() < 60) sawGreen = true;
    }
    assert(sawGreen);

    decoder.close();
    assert(!decoder.isOpen());
    printf("PASS: test_video_decode\n\n");
}

void test_audio_decode(const QString& clip) {
    printf("=== test_audio_decode ===\n");

    AudioDecoder decoder;
    bool ok = decoder.open(clip, Rate, 2);
    if (!ok) {
        printf("FAIL: cannot open audio - %s\n", decoder.errorString().toUtf8().constData());
        assert(false);
    }
    assert(decoder.outSampleRate() == Rate);
    assert(decoder.outChannels() == 2);

    std::vector<float> pcm;
    assert(decoder.decodeAll(pcm));
    double decodedSeconds = static_cast<double>(pcm.size()) / (Rate * 2);
    printf("  Decoded %.3f s of PCM\n", decodedSeconds);
    assert(std::abs(decodedSeconds - Seconds) < 0.15);

    float peak = 0.0f;
    for (float v : pcm) peak = std::max(peak, std::abs(v));
    assert(peak > 0.3f && peak < 0.7f);

    // Bounded decode after a seek
    assert(decoder.seek(1.0));
    std::vector<float> tail;
    assert(decoder.decodeAll(tail, 0.5));
    assert(tail.size() <= static_cast<size_t>(0.5 * Rate * 2) + 2);

    decoder.close();
    printf("PASS: test_audio_decode\n\n");
}

void test_decode_thread_seek_failure() {
    printf("=== test_decode_thread_seek_failure ===\n");

    // A decoder that never opened refuses every seek
    VideoDecoder decoder;
    FrameQueue queue(8);
    DecodeThread thread(&decoder, &queue);
    thread.start();

    thread.requestSeek(1.0);
    QElapsedTimer timer;
    timer.start();
    while (!thread.seekFailed() && timer.elapsed() < 2000)
        QThread::msleep(5);

    assert(thread.seekFailed());
    assert(thread.isEof());
    assert(queue.isEmpty());

    thread.requestStop();
    assert(thread.wait(2000));
    printf("PASS: test_decode_thread_seek_failure\n\n");
}

int main() {
    QTemporaryDir dir;
    assert(dir.isValid());

    test_image_probe(dir);
    test_decode_thread_seek_failure();

    QString clip = writeTestClip(dir);
    if (clip.isEmpty()) {
        printf("SKIP: decode tests (no usable encoder)\n");
        return 0;
    }
    test_media_probe(clip);
    test_video_decode(clip);
    test_audio_decode(clip);
    printf("All media decode tests passed.\n");
    return 0;
}
