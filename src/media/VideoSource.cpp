#include "VideoSource.h"
#include "AudioDecoder.h"
#include "Logging.h"
#include <cmath>

VideoSource::VideoSource(PlaybackClock* clock, int sampleRate, int channels)
    : MediaSource(clock, sampleRate, channels)
    , m_engine(std::make_unique<VideoPlaybackEngine>())
{}

VideoSource::~VideoSource() = default;

bool VideoSource::open(const QString& filePath) {
    if (!m_engine->open(filePath)) {
        m_error = m_engine->errorString();
        return false;
    }

    if (m_engine->info().hasAudio) {
        AudioDecoder audio;
        auto pcm = std::make_shared<std::vector<float>>();
        if (audio.open(filePath, m_sampleRate, m_channels) && audio.decodeAll(*pcm)) {
            setPcm(pcm);
        } else {
            qCWarning(srMedia, "video %s: audio unavailable: %s",
                      qPrintable(filePath), qPrintable(audio.errorString()));
        }
    }

    m_seeking = true;
    m_seekTarget = 0.0;
    return true;
}

bool VideoSource::isReady() const {
    return m_engine->isOpen() && m_engine->info().duration > 0.0;
}

double VideoSource::duration() const {
    return m_engine->info().duration;
}

QSize VideoSource::naturalSize() const {
    return QSize(m_engine->info().width, m_engine->info().height);
}

void VideoSource::onPositionChanged(double seconds) {
    // Small forward moves can be served from the queue without a decoder seek
    double frameDur = m_engine->info().fps > 0 ? 1.0 / m_engine->info().fps : 1.0 / 30.0;
    if (m_hasCurrent && !m_seeking && seconds >= m_current.pts
        && seconds - m_current.pts < 4 * frameDur) {
        return;
    }
    m_engine->seek(seconds);
    m_seeking = true;
    m_seekTarget = seconds;
}

void VideoSource::pump() {
    TimedFrame frame;
    if (!m_engine->advanceTo(position() + 0.001, frame)) {
        // Target past the last frame: hold the final one
        if (m_seeking && m_hasCurrent && m_engine->isFinished()) m_seeking = false;
        return;
    }

    m_current = frame;
    m_hasCurrent = true;
    if (m_seeking) {
        double frameDur = m_engine->info().fps > 0 ? 1.0 / m_engine->info().fps : 1.0 / 30.0;
        if (frame.pts >= m_seekTarget - frameDur) m_seeking = false;
    }
}

bool VideoSource::hasFrame() {
    if (!m_engine->isOpen()) return false;
    pump();
    return m_hasCurrent && !m_seeking;
}

QImage VideoSource::currentFrame() {
    pump();
    return m_hasCurrent ? m_current.image : QImage();
}
