#include "AudioMixer.h"
#include "AudioEndpoint.h"
#include "MediaSource.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

namespace {
    constexpr double MaxBlockSeconds = 0.25;
    // Longer monitor gaps (a stalled UI thread) are dropped rather than rendered late
    constexpr double MaxCatchUpSeconds = 0.5;
}

AudioMixer::AudioMixer(int sampleRate, int channels, QObject* parent)
    : QObject(parent), m_sampleRate(sampleRate), m_channels(channels) {}

AudioMixer::~AudioMixer() = default;

void AudioMixer::setDestination(Destination dest) {
    if (dest == m_destination) return;

    // Whatever the old destination still holds must not leak into the new one
    if (AudioEndpoint* old = activeEndpoint()) old->flush();
    m_destination = dest;
    if (AudioEndpoint* now = activeEndpoint()) now->flush();

    qCInfo(srAudio) << "destination" << (dest == Destination::Export ? "export" : "monitor");
    emit destinationChanged(dest);
}

AudioEndpoint* AudioMixer::activeEndpoint() const {
    return m_destination == Destination::Export ? m_export : m_monitor;
}

void AudioMixer::addPath(const QString& key, MediaSource* source) {
    if (!source) return;
    Path& path = m_paths[key];
    path.source = source;
    path.gain = GainParam(0.0);
    qCDebug(srAudio) << "path added" << key;
}

void AudioMixer::removePath(const QString& key) {
    if (m_paths.erase(key) > 0) qCDebug(srAudio) << "path removed" << key;
}

double AudioMixer::gain(const QString& key) const {
    auto it = m_paths.find(key);
    return it != m_paths.end() ? it->second.gain.valueAt(currentTime()) : 0.0;
}

double AudioMixer::targetGain(const QString& key) const {
    auto it = m_paths.find(key);
    return it != m_paths.end() ? it->second.gain.target() : 0.0;
}

void AudioMixer::setGain(const QString& key, double target, double timeConstant) {
    auto it = m_paths.find(key);
    if (it == m_paths.end()) return;
    if (!std::isfinite(target)) target = 0.0;
    it->second.gain.setTargetAtTime(std::max(0.0, target), currentTime(), timeConstant);
}

void AudioMixer::silenceAll(double timeConstant) {
    double t = currentTime();
    for (auto& [key, path] : m_paths) path.gain.setTargetAtTime(0.0, t, timeConstant);
}

double AudioMixer::currentTime() const {
    return static_cast<double>(m_renderedFrames) / m_sampleRate;
}

void AudioMixer::resetClock(double now) {
    m_anchor = now;
    m_pumpedFrames = 0;
    m_anchored = true;
}

int AudioMixer::process(double now) {
    if (!m_anchored) resetClock(now);

    int64_t wanted = static_cast<int64_t>((now - m_anchor) * m_sampleRate);
    int64_t due = wanted - m_pumpedFrames;
    if (due <= 0) return 0;

    int64_t cap = static_cast<int64_t>(MaxBlockSeconds * m_sampleRate);

    // The exported stream must cover every due frame, however late
    if (m_destination == Destination::Export) {
        int rendered = 0;
        while (due > 0) {
            int64_t block = std::min(due, cap);
            m_pumpedFrames += block;
            rendered += render(static_cast<int>(block));
            due -= block;
        }
        return rendered;
    }

    if (due > static_cast<int64_t>(MaxCatchUpSeconds * m_sampleRate)) {
        qCDebug(srAudio) << "pump stalled, skipping" << (due - cap) << "frames";
        m_pumpedFrames = wanted - cap;
        due = cap;
    } else {
        due = std::min(due, cap);
    }
    m_pumpedFrames += due;
    return render(static_cast<int>(due));
}

int AudioMixer::render(int frames) {
    if (frames <= 0) return 0;

    size_t samples = static_cast<size_t>(frames) * m_channels;
    m_mix.assign(samples, 0.0f);
    m_scratch.resize(samples);

    double t0 = currentTime();
    double dt = 1.0 / m_sampleRate;

    for (auto& [key, path] : m_paths) {
        int got = path.source->readAudio(m_scratch.data(), frames);
        if (got <= 0) continue;

        for (int f = 0; f < got; ++f) {
            float g = static_cast<float>(path.gain.valueAt(t0 + f * dt));
            if (g == 0.0f) continue;
            float* dst = m_mix.data() + static_cast<size_t>(f) * m_channels;
            const float* src = m_scratch.data() + static_cast<size_t>(f) * m_channels;
            for (int c = 0; c < m_channels; ++c) dst[c] += src[c] * g;
        }
    }

    m_renderedFrames += frames;

    if (AudioEndpoint* endpoint = activeEndpoint())
        endpoint->writeAudio(m_mix.data(), frames);
    return frames;
}
