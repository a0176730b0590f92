#pragma once

#include <QObject>
#include <QImage>
#include <QString>
#include "EngineConfig.h"
#include "EncodingProfile.h"

class PlaybackEngine;
class Compositor;
class AudioMixer;
class ExportAudioSink;
class StreamRecorder;
class FrameScheduler;

enum class ExportState {
    Idle,
    Priming,
    Recording,
    Finalizing,
    Done,
    Failed
};

struct ExportArtifact {
    QString filePath;
    QString fileName;
    QString mimeType;
    EncodingProfile profile;
    qint64 sizeBytes = 0;
    double duration = 0.0;
};

// Drives one export: primes the sources, records the live render loop at a
// fixed frame rate together with the mixer's export audio, then writes the
// encoded result to a single file.
class ExportPipeline : public QObject {
    Q_OBJECT
public:
    ExportPipeline(PlaybackEngine* engine, Compositor* compositor, AudioMixer* mixer,
                   ExportAudioSink* sink, StreamRecorder* recorder, FrameScheduler* scheduler,
                   const EngineConfig& config, QObject* parent = nullptr);
    ~ExportPipeline();

    void setEncoderProbe(EncoderProbe probe) { m_probe = std::move(probe); }
    void setConfig(const EngineConfig& config) { m_config = config; }
    QString outputDirectory() const;

    // False when an export is already running or there is nothing to export.
    bool startExport();
    // Manual stop: finalizes what has been recorded so far.
    void stopExport();
    // Back to Idle from Done or Failed.
    void reset();

    ExportState state() const { return m_state; }
    bool isBusy() const;
    const ExportArtifact& lastArtifact() const { return m_artifact; }
    const EncodingProfile& profile() const { return m_profile; }
    int framesWritten() const { return m_framesWritten; }
    QString errorString() const { return m_error; }

    static QString stateName(ExportState state);

signals:
    void stateChanged(ExportState state);
    void priming();
    void recording();
    void done(const ExportArtifact& artifact);
    void failed(const QString& reason);
    void progress(double fraction);

private:
    void setState(ExportState state);
    void settle(int session);
    void beginRecording(int session);
    void onFrameRendered(double time, const QImage& canvas);
    void onEnded();
    void onRenderFailed(const QString& reason);
    bool drainAudio();
    void finalize();
    void failWith(const QString& reason);
    void cancelPending();

    PlaybackEngine* m_engine;
    Compositor* m_compositor;
    AudioMixer* m_mixer;
    ExportAudioSink* m_sink;
    StreamRecorder* m_recorder;
    FrameScheduler* m_scheduler;
    EngineConfig m_config;
    EncoderProbe m_probe;

    ExportState m_state = ExportState::Idle;
    EncodingProfile m_profile;
    ExportArtifact m_artifact;
    QString m_error;

    int m_session = 0;
    int m_pending = 0;
    int m_framesWritten = 0;
    double m_recordedTime = 0.0;
};
