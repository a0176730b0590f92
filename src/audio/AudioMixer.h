#pragma once

#include <QObject>
#include <QString>
#include <map>
#include <vector>
#include "GainParam.h"

class AudioEndpoint;
class MediaSource;

// Mixing graph: one gain-controlled path per audio-capable source, all
// summed into a single destination. The destination is either the monitor
// output or the export sink, never both.
class AudioMixer : public QObject {
    Q_OBJECT
public:
    enum class Destination {
        Monitor,
        Export
    };

    explicit AudioMixer(int sampleRate, int channels, QObject* parent = nullptr);
    ~AudioMixer();

    void setMonitorEndpoint(AudioEndpoint* endpoint) { m_monitor = endpoint; }
    void setExportEndpoint(AudioEndpoint* endpoint) { m_export = endpoint; }
    void setDestination(Destination dest);
    Destination destination() const { return m_destination; }

    void addPath(const QString& key, MediaSource* source);
    void removePath(const QString& key);
    bool hasPath(const QString& key) const { return m_paths.count(key) > 0; }
    int pathCount() const { return static_cast<int>(m_paths.size()); }

    // Current value of a path's gain at the mixer's audio time (0 if unknown).
    double gain(const QString& key) const;
    double targetGain(const QString& key) const;
    // Ramp toward target starting now. Unknown keys are ignored.
    void setGain(const QString& key, double target, double timeConstant);
    void silenceAll(double timeConstant);

    // Seconds of audio rendered since construction.
    double currentTime() const;

    // Re-anchors the real-time pump at now; nothing owed is rendered.
    void resetClock(double now);
    // Renders the frames due since the last pump into the destination. The
    // monitor gets capped blocks and drops long stalls; export gets every frame.
    int process(double now);
    // Renders exactly `frames` frames into the destination.
    int render(int frames);

    int sampleRate() const { return m_sampleRate; }
    int channels() const { return m_channels; }

signals:
    void destinationChanged(AudioMixer::Destination dest);

private:
    struct Path {
        MediaSource* source = nullptr;
        GainParam gain;
    };

    AudioEndpoint* activeEndpoint() const;

    int m_sampleRate;
    int m_channels;
    std::map<QString, Path> m_paths;
    AudioEndpoint* m_monitor = nullptr;
    AudioEndpoint* m_export = nullptr;
    Destination m_destination = Destination::Monitor;

    int64_t m_renderedFrames = 0;
    double m_anchor = 0.0;
    int64_t m_pumpedFrames = 0;
    bool m_anchored = false;

    std::vector<float> m_mix;
    std::vector<float> m_scratch;
};
