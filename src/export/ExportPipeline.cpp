#include "ExportPipeline.h"
#include "PlaybackEngine.h"
#include "Compositor.h"
#include "AudioMixer.h"
#include "ExportAudioSink.h"
#include "StreamRecorder.h"
#include "FrameScheduler.h"
#include "AppConstants.h"
#include "TimeUtil.h"
#include "Logging.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QStandardPaths>
#include <cmath>

ExportPipeline::ExportPipeline(PlaybackEngine* engine, Compositor* compositor, AudioMixer* mixer,
                               ExportAudioSink* sink, StreamRecorder* recorder, FrameScheduler* scheduler,
                               const EngineConfig& config, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_compositor(compositor)
    , m_mixer(mixer)
    , m_sink(sink)
    , m_recorder(recorder)
    , m_scheduler(scheduler)
    , m_config(config)
    , m_probe(&EncodingProfiles::ffmpegHasEncoder)
{
    connect(m_engine, &PlaybackEngine::frameRendered, this, &ExportPipeline::onFrameRendered);
    connect(m_engine, &PlaybackEngine::ended, this, &ExportPipeline::onEnded);
    connect(m_engine, &PlaybackEngine::renderFailed, this, &ExportPipeline::onRenderFailed);
}

ExportPipeline::~ExportPipeline() {
    cancelPending();
    if (m_state == ExportState::Recording || m_state == ExportState::Priming) m_recorder->abort();
}

QString ExportPipeline::stateName(ExportState state) {
    switch (state) {
    case ExportState::Idle: return "idle";
    case ExportState::Priming: return "priming";
    case ExportState::Recording: return "recording";
    case ExportState::Finalizing: return "finalizing";
    case ExportState::Done: return "done";
    case ExportState::Failed: return "failed";
    }
    return QString();
}

QString ExportPipeline::outputDirectory() const {
    if (!m_config.exportDirectory.isEmpty()) return m_config.exportDirectory;
    return QStandardPaths::writableLocation(QStandardPaths::MoviesLocation);
}

bool ExportPipeline::isBusy() const {
    return m_state == ExportState::Priming || m_state == ExportState::Recording
        || m_state == ExportState::Finalizing;
}

void ExportPipeline::setState(ExportState state) {
    if (m_state == state) return;
    m_state = state;
    qCDebug(srExport) << "state:" << stateName(state);
    emit stateChanged(state);
}

void ExportPipeline::cancelPending() {
    if (m_pending) {
        m_scheduler->cancel(m_pending);
        m_pending = 0;
    }
}

bool ExportPipeline::startExport() {
    if (isBusy()) {
        m_error = tr("An export is already running");
        return false;
    }
    if (m_engine->duration() <= 0.0) {
        m_error = tr("Nothing to export");
        return false;
    }

    ++m_session;
    m_error.clear();
    m_artifact = ExportArtifact{};
    m_framesWritten = 0;
    m_recordedTime = 0.0;
    m_profile = EncodingProfiles::negotiate(m_probe);

    setState(ExportState::Priming);
    emit priming();
    qCInfo(srExport) << "export started, keep the window visible while exporting";

    m_engine->stop();
    m_compositor->primeVideoSources();
    m_mixer->setDestination(AudioMixer::Destination::Export);
    m_sink->flush();
    m_compositor->render(0.0, RenderMode::Exact, true);

    int session = m_session;
    m_pending = m_scheduler->schedule(AppConstants::PrimingSettleMs, [this, session]() {
        m_pending = 0;
        settle(session);
    });
    return true;
}

void ExportPipeline::settle(int session) {
    if (session != m_session || m_state != ExportState::Priming) return;

    // Second exact frame once decoders had time to reach their start frames
    m_compositor->render(0.0, RenderMode::Exact, true);
    m_pending = m_scheduler->schedule(AppConstants::PrimingRecordDelayMs, [this, session]() {
        m_pending = 0;
        beginRecording(session);
    });
}

void ExportPipeline::beginRecording(int session) {
    if (session != m_session || m_state != ExportState::Priming) return;

    RecorderSettings settings;
    settings.profile = m_profile;
    settings.width = m_config.canvasWidth;
    settings.height = m_config.canvasHeight;
    settings.fps = qRound(m_config.fps);
    settings.videoBitrate = m_config.exportVideoBitrate;
    settings.audioBitrate = m_config.exportAudioBitrate;
    settings.sampleRate = m_mixer->sampleRate();
    settings.channels = m_mixer->channels();

    if (!m_recorder->start(settings)) {
        failWith(tr("Cannot start recording: %1").arg(m_recorder->errorString()));
        return;
    }

    // Priming audio is not part of the export
    m_sink->flush();

    setState(ExportState::Recording);
    emit recording();
    m_engine->start(0.0, true);
}

void ExportPipeline::onFrameRendered(double time, const QImage& canvas) {
    if (m_state != ExportState::Recording) return;

    // Fixed-rate capture: repeat the canvas when the loop lags, skip when early
    int target = qMax(1, static_cast<int>(std::ceil(time * m_config.fps - 1e-6)));
    while (m_framesWritten < target) {
        if (!m_recorder->writeVideoFrame(canvas)) {
            failWith(tr("Video encoding failed: %1").arg(m_recorder->errorString()));
            return;
        }
        ++m_framesWritten;
    }
    m_recordedTime = time;

    if (!drainAudio()) return;

    double total = m_engine->duration();
    if (total > 0.0) emit progress(qMin(1.0, time / total));
}

bool ExportPipeline::drainAudio() {
    std::vector<float> samples = m_sink->takeSamples();
    if (samples.empty()) return true;

    int frames = static_cast<int>(samples.size() / m_sink->channels());
    if (!m_recorder->writeAudio(samples.data(), frames)) {
        failWith(tr("Audio encoding failed: %1").arg(m_recorder->errorString()));
        return false;
    }
    return true;
}

void ExportPipeline::onEnded() {
    if (m_state == ExportState::Recording) finalize();
}

void ExportPipeline::onRenderFailed(const QString& reason) {
    if (m_state == ExportState::Recording) failWith(reason);
}

void ExportPipeline::stopExport() {
    if (m_state == ExportState::Priming) {
        cancelPending();
        m_mixer->setDestination(AudioMixer::Destination::Monitor);
        qCInfo(srExport) << "export cancelled while priming";
        setState(ExportState::Idle);
        return;
    }
    if (m_state != ExportState::Recording) return;

    m_engine->stop();
    finalize();
}

void ExportPipeline::finalize() {
    setState(ExportState::Finalizing);
    if (!drainAudio()) return;

    QByteArray data;
    if (!m_recorder->finish(data)) {
        failWith(tr("Cannot finalize export: %1").arg(m_recorder->errorString()));
        return;
    }

    QString dir = outputDirectory();
    if (!QDir().mkpath(dir)) {
        failWith(tr("Cannot create output directory %1").arg(dir));
        return;
    }

    QString fileName = TimeUtil::exportFileName(QDateTime::currentDateTime(), m_profile.extension);
    QString filePath = QDir(dir).filePath(fileName);
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size()) {
        failWith(tr("Cannot write %1: %2").arg(filePath, file.errorString()));
        return;
    }
    file.close();

    m_artifact.filePath = filePath;
    m_artifact.fileName = fileName;
    m_artifact.mimeType = m_profile.mimeType;
    m_artifact.profile = m_profile;
    m_artifact.sizeBytes = data.size();
    m_artifact.duration = m_recordedTime;

    m_mixer->setDestination(AudioMixer::Destination::Monitor);
    qCInfo(srExport) << "export done:" << filePath << data.size() << "bytes";

    setState(ExportState::Done);
    emit done(m_artifact);
}

void ExportPipeline::failWith(const QString& reason) {
    m_error = reason;
    qCWarning(srExport) << "export failed:" << reason;

    cancelPending();
    if (m_engine->isPlaying()) m_engine->stop();
    m_recorder->abort();
    m_sink->flush();
    m_mixer->setDestination(AudioMixer::Destination::Monitor);

    setState(ExportState::Failed);
    emit failed(reason);
    reset();
}

void ExportPipeline::reset() {
    if (isBusy()) return;
    setState(ExportState::Idle);
}
