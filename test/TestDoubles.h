#pragma once

// Deterministic stand-ins for the clock, the frame scheduler, media sources,
// audio endpoints and the encoder, shared by the engine tests.

#include <QByteArray>
#include <QColor>
#include <QImage>
#include <QString>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <vector>

#include "util/PlaybackClock.h"
#include "render/FrameScheduler.h"
#include "media/MediaSource.h"
#include "media/ResourceBinder.h"
#include "audio/AudioEndpoint.h"
#include "export/StreamRecorder.h"

class ManualClock : public PlaybackClock {
public:
    double now() const override { return m_now; }
    void set(double seconds) { m_now = seconds; }
    void advance(double seconds) { m_now += seconds; }

private:
    double m_now = 100.0;
};

// Runs callbacks only when the test advances time; the clock moves with it.
class ManualScheduler : public FrameScheduler {
public:
    explicit ManualScheduler(ManualClock* clock) : m_clock(clock) {}

    int schedule(int delayMs, std::function<void()> callback) override {
        int handle = m_nextHandle++;
        m_tasks[handle] = Task{m_nowMs + delayMs, std::move(callback)};
        return handle;
    }

    void cancel(int handle) override { m_tasks.erase(handle); }

    int pending() const { return static_cast<int>(m_tasks.size()); }

    // Fires every task due within the next ms milliseconds, in due order.
    void advance(double ms) {
        double target = m_nowMs + ms;
        while (true) {
            auto next = m_tasks.end();
            for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
                if (it->second.dueMs <= target && (next == m_tasks.end() || it->second.dueMs < next->second.dueMs))
                    next = it;
            }
            if (next == m_tasks.end()) break;

            moveTo(next->second.dueMs);
            std::function<void()> fn = std::move(next->second.fn);
            m_tasks.erase(next);
            fn();
        }
        moveTo(target);
    }

private:
    struct Task {
        double dueMs = 0.0;
        std::function<void()> fn;
    };

    void moveTo(double ms) {
        if (ms <= m_nowMs) return;
        m_clock->advance((ms - m_nowMs) / 1000.0);
        m_nowMs = ms;
    }

    ManualClock* m_clock;
    std::map<int, Task> m_tasks;
    int m_nextHandle = 1;
    double m_nowMs = 0.0;
};

struct FakeMedia {
    double duration = 10.0;
    QColor color = Qt::red;
    float pcmValue = 0.0f;      // 0 = no audio track
    bool fail = false;
};

class FakeSource : public MediaSource {
public:
    FakeSource(PlaybackClock* clock, const FakeMedia& media, int sampleRate = 48000, int channels = 2)
        : MediaSource(clock, sampleRate, channels), m_media(media) {
        if (media.fail) {
            m_error = "cannot decode";
            return;
        }
        if (media.pcmValue != 0.0f && media.duration > 0.0) {
            size_t n = static_cast<size_t>(media.duration * sampleRate) * channels;
            setPcm(std::make_shared<const std::vector<float>>(n, media.pcmValue));
        }
    }

    bool isReady() const override { return m_error.isEmpty(); }
    bool hasFrame() override { return isReady() && m_frameReady && m_clock->now() >= m_readyAt; }
    QImage currentFrame() override {
        if (m_throwOnFrame) throw std::runtime_error("frame unavailable");
        QImage image(naturalSize(), QImage::Format_RGB32);
        image.fill(m_media.color);
        return image;
    }
    QSize naturalSize() const override { return QSize(640, 360); }
    double duration() const override { return m_media.duration; }
    QString errorString() const override { return m_error; }

    bool setPosition(double seconds) override {
        ++seekCount;
        if (m_failSeeks) return false;
        return MediaSource::setPosition(seconds);
    }

    void setFrameReady(bool ready) { m_frameReady = ready; }
    // Frames appear only once the clock reaches seconds, like a decoder catching up.
    void setFrameReadyAt(double seconds) { m_readyAt = seconds; }
    void setThrowOnFrame(bool enabled) { m_throwOnFrame = enabled; }
    void setFailSeeks(bool enabled) { m_failSeeks = enabled; }

    int seekCount = 0;

private:
    FakeMedia m_media;
    QString m_error;
    bool m_frameReady = true;
    double m_readyAt = 0.0;
    bool m_throwOnFrame = false;
    bool m_failSeeks = false;
};

// Builds FakeSources by path and remembers the latest one per binder key.
class FakeMediaLibrary {
public:
    explicit FakeMediaLibrary(PlaybackClock* clock) : m_clock(clock) {}

    void add(const QString& path, const FakeMedia& media) { m_media[path] = media; }

    SourceFactory factory() {
        return [this](const SourceRequest& req) -> std::unique_ptr<MediaSource> {
            FakeMedia media;
            auto it = m_media.find(req.path);
            if (it != m_media.end()) media = it->second;
            if (req.kind == SourceKind::Image) media.duration = 0.0;
            auto src = std::make_unique<FakeSource>(m_clock, media);
            m_created[req.key] = src.get();
            ++createdCount;
            return src;
        };
    }

    FakeSource* source(const QString& key) const {
        auto it = m_created.find(key);
        return it != m_created.end() ? it->second : nullptr;
    }

    int createdCount = 0;

private:
    PlaybackClock* m_clock;
    std::map<QString, FakeMedia> m_media;
    std::map<QString, FakeSource*> m_created;
};

class CaptureEndpoint : public AudioEndpoint {
public:
    void writeAudio(const float* interleaved, int frames) override {
        samples.insert(samples.end(), interleaved, interleaved + frames * 2);
        writtenFrames += frames;
    }
    void flush() override {
        samples.clear();
        ++flushes;
    }

    std::vector<float> samples;
    long long writtenFrames = 0;
    int flushes = 0;
};

class FakeRecorder : public StreamRecorder {
public:
    bool start(const RecorderSettings& s) override {
        if (failStart) {
            m_error = "encoder unavailable";
            return false;
        }
        settings = s;
        recording = true;
        ++starts;
        videoFrames = 0;
        audioFrames = 0;
        return true;
    }

    bool writeVideoFrame(const QImage& frame) override {
        if (!recording || frame.isNull()) return false;
        if (failVideoAt >= 0 && videoFrames >= failVideoAt) {
            m_error = "video encoder error";
            return false;
        }
        ++videoFrames;
        return true;
    }

    bool writeAudio(const float*, int frames) override {
        if (!recording) return false;
        audioFrames += frames;
        return true;
    }

    bool finish(QByteArray& output) override {
        if (!recording) return false;
        recording = false;
        ++finishes;
        output = QByteArray("encoded:") + QByteArray::number(videoFrames);
        return true;
    }

    void abort() override {
        recording = false;
        ++aborts;
    }

    QString errorString() const override { return m_error; }

    RecorderSettings settings;
    bool failStart = false;
    int failVideoAt = -1;
    bool recording = false;
    int starts = 0;
    int finishes = 0;
    int aborts = 0;
    long long videoFrames = 0;
    long long audioFrames = 0;

private:
    QString m_error;
};
