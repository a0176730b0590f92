#include "MediaSource.h"
#include "PlaybackClock.h"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace {
    // Audio cursor is pulled back to the clock position past this drift
    constexpr double AudioResyncThreshold = 0.1;
}

MediaSource::MediaSource(PlaybackClock* clock, int sampleRate, int channels)
    : m_clock(clock), m_sampleRate(sampleRate), m_channels(channels) {}

MediaSource::~MediaSource() = default;

double MediaSource::position() const {
    double pos = m_anchorPosition;
    if (m_playing) pos += m_clock->now() - m_anchorClock;
    double d = duration();
    if (d > 0.0 && std::isfinite(d)) pos = std::min(pos, d);
    return std::max(0.0, pos);
}

bool MediaSource::setPosition(double seconds) {
    m_anchorPosition = std::max(0.0, seconds);
    m_anchorClock = m_clock->now();
    resyncAudioCursor();
    onPositionChanged(m_anchorPosition);
    return true;
}

void MediaSource::play() {
    if (m_playing) return;
    m_anchorPosition = position();
    m_anchorClock = m_clock->now();
    m_playing = true;
}

void MediaSource::pause() {
    if (!m_playing) return;
    m_anchorPosition = position();
    m_playing = false;
}

void MediaSource::onPositionChanged(double) {}

void MediaSource::setPcm(std::shared_ptr<const std::vector<float>> pcm) {
    m_pcm = std::move(pcm);
    resyncAudioCursor();
}

void MediaSource::resyncAudioCursor() {
    m_audioCursor = static_cast<int64_t>(std::llround(position() * m_sampleRate));
}

int MediaSource::readAudio(float* out, int frames) {
    std::memset(out, 0, sizeof(float) * static_cast<size_t>(frames) * m_channels);
    if (!m_playing || !hasAudio()) return 0;

    double cursorTime = static_cast<double>(m_audioCursor) / m_sampleRate;
    if (std::abs(cursorTime - position()) > AudioResyncThreshold)
        resyncAudioCursor();

    int64_t available = static_cast<int64_t>(m_pcm->size() / m_channels) - m_audioCursor;
    if (available <= 0 || m_audioCursor < 0) return 0;

    int n = static_cast<int>(std::min<int64_t>(available, frames));
    std::memcpy(out, m_pcm->data() + m_audioCursor * m_channels,
                sizeof(float) * static_cast<size_t>(n) * m_channels);
    m_audioCursor += frames;
    return n;
}
