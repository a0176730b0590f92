#include "MainWindow.h"
#include "AppConstants.h"
#include "Logging.h"
#include "PlaybackClock.h"
#include "TimelineModel.h"
#include "AudioTrackModel.h"
#include "CaptionModel.h"
#include "MediaProbe.h"
#include "ResourceBinder.h"
#include "AudioMixer.h"
#include "AudioOutput.h"
#include "ExportAudioSink.h"
#include "Compositor.h"
#include "FrameScheduler.h"
#include "PlaybackEngine.h"
#include "MediaExporter.h"
#include "ExportPipeline.h"
#include "ClipListPanel.h"
#include "ItemInspector.h"
#include "AudioPanel.h"
#include "PreviewWidget.h"

#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QCloseEvent>
#include <QDialog>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>

namespace {

const char* const VisualFilter =
    "Media Files (*.mp4 *.mov *.webm *.mkv *.avi *.jpg *.jpeg *.png *.bmp *.webp);;All Files (*)";
const char* const AudioFilter =
    "Audio Files (*.mp3 *.m4a *.aac *.wav *.ogg *.opus *.flac);;All Files (*)";

} // namespace

MainWindow::MainWindow(const EngineConfig& config, QWidget* parent)
    : QMainWindow(parent)
    , m_config(config)
    , m_clock(std::make_unique<SteadyClock>())
    , m_exportSink(std::make_unique<ExportAudioSink>(AppConstants::MixChannels))
{
    setWindowTitle(QString("%1 v%2").arg(AppConstants::AppName, AppConstants::AppVersion));
    resize(AppConstants::DefaultWindowWidth, AppConstants::DefaultWindowHeight);

    setupEngine();
    setupUi();
    setupMenuBar();
    setupDockWidgets();
    connectSignals();

    statusBar()->showMessage("Ready");
}

MainWindow::~MainWindow() {
    m_engine->stop();

    // Reverse of setupEngine(): the pipeline and the engine still cancel
    // pending callbacks on the scheduler and abort the recorder.
    delete m_exportPipeline;
    delete m_recorder;
    delete m_engine;
    delete m_scheduler;
    m_binder->releaseAll();
}

void MainWindow::setupEngine() {
    m_timeline = new TimelineModel(this);
    m_tracks = new AudioTrackModel(this);
    m_captions = new CaptionModel(this);

    m_binder = new ResourceBinder(m_timeline, m_tracks, m_clock.get(), this);
    m_mixer = new AudioMixer(AppConstants::MixSampleRate, AppConstants::MixChannels, this);

    m_audioOutput = new AudioOutput(AppConstants::MixSampleRate, AppConstants::MixChannels, 250, this);
    if (m_audioOutput->open()) {
        m_mixer->setMonitorEndpoint(m_audioOutput);
        m_audioOutput->start();
    } else {
        qCWarning(srApp) << "Preview audio disabled:" << m_audioOutput->errorString();
    }
    m_mixer->setExportEndpoint(m_exportSink.get());

    m_compositor = new Compositor(m_timeline, m_tracks, m_captions, m_binder, m_mixer, m_config, this);
    m_scheduler = new TimerFrameScheduler(this);
    m_engine = new PlaybackEngine(m_compositor, m_mixer, m_timeline, m_clock.get(), m_scheduler, this);

    m_recorder = new MediaExporter(this);
    m_exportPipeline = new ExportPipeline(m_engine, m_compositor, m_mixer, m_exportSink.get(),
                                          m_recorder, m_scheduler, m_config, this);
}

void MainWindow::setupUi() {
    m_previewWidget = new PreviewWidget(this);
    m_previewWidget->setCanvasSize(QSize(m_config.canvasWidth, m_config.canvasHeight));
    setCentralWidget(m_previewWidget);

    m_clipList = new ClipListPanel(m_timeline, this);
    m_inspector = new ItemInspector(m_timeline, this);
    m_audioPanel = new AudioPanel(m_tracks, this);

    m_exportProgress = new QProgressBar(this);
    m_exportProgress->setRange(0, 1000);
    m_exportProgress->setMaximumWidth(220);
    m_exportProgress->setVisible(false);
    statusBar()->addPermanentWidget(m_exportProgress);
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");

    auto* addClipsAction = fileMenu->addAction("&Add Clips...");
    connect(addClipsAction, &QAction::triggered, this, &MainWindow::onAddClips);

    auto* musicAction = fileMenu->addAction("Set &Music...");
    connect(musicAction, &QAction::triggered, this, &MainWindow::onSetMusic);

    auto* narrationAction = fileMenu->addAction("Add &Narration...");
    connect(narrationAction, &QAction::triggered, this, &MainWindow::onAddNarration);

    auto* captionsAction = fileMenu->addAction("Import &Captions...");
    connect(captionsAction, &QAction::triggered, this, &MainWindow::onImportCaptions);

    fileMenu->addSeparator();

    m_exportAction = fileMenu->addAction("&Export");
    m_exportAction->setShortcut(QKeySequence("Ctrl+E"));
    connect(m_exportAction, &QAction::triggered, this, &MainWindow::onExportRequested);

    m_stopExportAction = fileMenu->addAction("&Stop Export");
    m_stopExportAction->setEnabled(false);
    connect(m_stopExportAction, &QAction::triggered, this, &MainWindow::onStopExport);

    fileMenu->addSeparator();

    auto* exitAction = fileMenu->addAction("E&xit");
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    auto* playbackMenu = menuBar()->addMenu("&Playback");
    auto* playAction = playbackMenu->addAction("Play / Pause");
    playAction->setShortcut(QKeySequence(Qt::Key_Space));
    connect(playAction, &QAction::triggered, this, [this]() {
        if (!m_exportPipeline->isBusy()) m_engine->togglePlayPause();
    });
    auto* rewindAction = playbackMenu->addAction("Go to Start");
    rewindAction->setShortcut(QKeySequence(Qt::Key_Home));
    connect(rewindAction, &QAction::triggered, this, [this]() {
        if (!m_exportPipeline->isBusy()) m_engine->seek(0.0);
    });

    m_viewMenu = menuBar()->addMenu("&View");

    auto* helpMenu = menuBar()->addMenu("&Help");
    auto* logAction = helpMenu->addAction("Show &Log");
    connect(logAction, &QAction::triggered, this, &MainWindow::onShowLog);
    auto* aboutAction = helpMenu->addAction("&About");
    connect(aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, QString("About %1").arg(AppConstants::AppName),
            QString("<h3>%1 v%2</h3>"
                    "<p>Short-form video compositor with synchronized music, "
                    "narration and captions.</p>")
            .arg(AppConstants::AppName, AppConstants::AppVersion));
    });
}

void MainWindow::setupDockWidgets() {
    m_clipDock = new QDockWidget("Clips", this);
    m_clipDock->setWidget(m_clipList);
    m_clipDock->setObjectName("ClipDock");
    addDockWidget(Qt::LeftDockWidgetArea, m_clipDock);

    m_inspectorDock = new QDockWidget("Item", this);
    m_inspectorDock->setWidget(m_inspector);
    m_inspectorDock->setObjectName("InspectorDock");
    addDockWidget(Qt::RightDockWidgetArea, m_inspectorDock);

    m_audioDock = new QDockWidget("Audio", this);
    m_audioDock->setWidget(m_audioPanel);
    m_audioDock->setObjectName("AudioDock");
    addDockWidget(Qt::RightDockWidgetArea, m_audioDock);

    m_viewMenu->addAction(m_clipDock->toggleViewAction());
    m_viewMenu->addAction(m_inspectorDock->toggleViewAction());
    m_viewMenu->addAction(m_audioDock->toggleViewAction());
}

void MainWindow::connectSignals() {
    // Natural durations reported by opened sources
    connect(m_binder, &ResourceBinder::durationLoaded, m_timeline, &TimelineModel::setVideoDuration);
    connect(m_binder, &ResourceBinder::musicDurationLoaded, m_tracks, &AudioTrackModel::setMusicDuration);
    connect(m_binder, &ResourceBinder::narrationDurationLoaded, m_tracks, &AudioTrackModel::setNarrationDuration);
    connect(m_binder, &ResourceBinder::sourceFailed, this, [this](const QString& key, const QString& error) {
        statusBar()->showMessage(QString("Cannot open %1: %2").arg(key, error), 5000);
    });

    // Render loop → preview
    connect(m_engine, &PlaybackEngine::frameRendered, this, [this](double time, const QImage& canvas) {
        m_previewWidget->displayFrame(canvas);
        onFrameRendered(time);
    });
    connect(m_engine, &PlaybackEngine::tick, m_previewWidget, &PreviewWidget::setCurrentTime);
    connect(m_engine, &PlaybackEngine::stateChanged, this, [this](PlaybackState state) {
        m_previewWidget->setPlayingState(state == PlaybackState::Playing);
    });
    connect(m_engine, &PlaybackEngine::renderFailed, this, [this](const QString& reason) {
        statusBar()->showMessage(QString("Playback stopped: %1").arg(reason), 5000);
    });

    // Preview controls → render loop
    connect(m_previewWidget, &PreviewWidget::playPauseClicked, m_engine, &PlaybackEngine::togglePlayPause);
    connect(m_previewWidget, &PreviewWidget::seekRequested, m_engine, &PlaybackEngine::seek);
    connect(m_previewWidget, &PreviewWidget::stepForward, this, [this]() {
        m_engine->seek(m_engine->currentTime() + 1.0 / m_config.fps);
    });
    connect(m_previewWidget, &PreviewWidget::stepBackward, this, [this]() {
        m_engine->seek(m_engine->currentTime() - 1.0 / m_config.fps);
    });
    connect(m_previewWidget, &PreviewWidget::transformEdited, this, [this](double scale, double x, double y) {
        if (m_selectedId.isEmpty()) return;
        m_timeline->updateScale(m_selectedId, scale);
        m_timeline->updatePosition(m_selectedId, x, y);
    });

    // Selection
    connect(m_clipList, &ClipListPanel::addRequested, this, &MainWindow::onAddClips);
    connect(m_clipList, &ClipListPanel::selectionChanged, this, &MainWindow::onSelectionChanged);
    connect(m_audioPanel, &AudioPanel::setMusicRequested, this, &MainWindow::onSetMusic);
    connect(m_audioPanel, &AudioPanel::addNarrationRequested, this, &MainWindow::onAddNarration);

    // Model edits → re-render the paused frame
    connect(m_timeline, &TimelineModel::itemsChanged, this, &MainWindow::scheduleRefresh);
    connect(m_tracks, &AudioTrackModel::tracksChanged, this, &MainWindow::scheduleRefresh);
    connect(m_captions, &CaptionModel::captionsChanged, this, &MainWindow::scheduleRefresh);

    // Export
    connect(m_exportPipeline, &ExportPipeline::priming, this, [this]() {
        setExporting(true);
        statusBar()->showMessage("Preparing export. Keep this window visible until it finishes.");
    });
    connect(m_exportPipeline, &ExportPipeline::recording, this, [this]() {
        statusBar()->showMessage(QString("Recording %1...").arg(m_exportPipeline->profile().description()));
    });
    connect(m_exportPipeline, &ExportPipeline::progress, this, [this](double fraction) {
        m_exportProgress->setValue(qRound(fraction * 1000));
    });
    connect(m_exportPipeline, &ExportPipeline::done, this, &MainWindow::onExportDone);
    connect(m_exportPipeline, &ExportPipeline::failed, this, &MainWindow::onExportFailed);
}

void MainWindow::scheduleRefresh() {
    m_previewWidget->setDuration(m_engine->duration());
    if (m_refreshPending) return;
    m_refreshPending = true;
    QTimer::singleShot(0, this, [this]() {
        m_refreshPending = false;
        if (m_engine->isPlaying() || m_exportPipeline->isBusy()) return;
        m_engine->seek(m_engine->currentTime());
    });
}

void MainWindow::onFrameRendered(double time) {
    Q_UNUSED(time);
    updateSelectionOverlay();
}

void MainWindow::updateSelectionOverlay() {
    const FrameState& frame = m_compositor->lastFrame();
    const MediaItem* item = m_timeline->find(m_selectedId);
    if (!item || m_exportPipeline->isBusy() || !frame.drawn || frame.itemId != m_selectedId) {
        m_previewWidget->clearSelection();
        return;
    }
    m_previewWidget->setSelection(item->transform, frame.drawRect);
}

void MainWindow::onSelectionChanged(const QString& id) {
    m_selectedId = id;
    m_inspector->setItem(id);

    // Jump to the selected item's start so it is visible.
    if (!m_engine->isPlaying() && !m_exportPipeline->isBusy()) {
        int index = m_timeline->indexOf(id);
        if (index >= 0) {
            double start = 0.0;
            for (int i = 0; i < index; ++i) start += m_timeline->items()[i].duration;
            double current = m_engine->currentTime();
            double end = start + m_timeline->items()[index].duration;
            if (current < start || current >= end) m_engine->seek(start);
        }
    }
    updateSelectionOverlay();
}

void MainWindow::onAddClips() {
    QStringList paths = QFileDialog::getOpenFileNames(this, "Add Clips", {}, VisualFilter);
    if (paths.isEmpty()) return;

    QString firstAdded;
    int rejected = 0;
    for (const QString& path : paths) {
        MediaProbe probe;
        if (!probe.probe(path)) {
            qCWarning(srApp) << "Skipping" << path << ":" << probe.errorString();
            ++rejected;
            continue;
        }
        const MediaInfo& info = probe.info();
        if (info.kind != ProbedKind::Video && info.kind != ProbedKind::Image) {
            ++rejected;
            continue;
        }

        MediaItem item;
        item.sourcePath = path;
        item.displayName = QFileInfo(path).fileName();
        item.kind = info.kind == ProbedKind::Image ? MediaKind::Image : MediaKind::Video;
        QString id = m_timeline->addItem(item);
        if (item.isVideo() && info.duration > 0.0)
            m_timeline->setVideoDuration(id, info.duration);
        if (firstAdded.isEmpty()) firstAdded = id;
    }

    if (rejected > 0)
        statusBar()->showMessage(QString("%1 file(s) could not be added").arg(rejected), 5000);
    if (m_selectedId.isEmpty() && !firstAdded.isEmpty())
        m_clipList->selectItem(firstAdded);
}

void MainWindow::onSetMusic() {
    QString path = QFileDialog::getOpenFileName(this, "Background Music", {}, AudioFilter);
    if (path.isEmpty()) return;

    MediaProbe probe;
    if (!probe.probe(path) || !probe.info().hasAudio) {
        QMessageBox::warning(this, "Music", QString("Cannot use %1 as music.\n%2")
            .arg(QFileInfo(path).fileName(), probe.errorString()));
        return;
    }

    AudioTrack track;
    track.sourcePath = path;
    track.displayName = QFileInfo(path).fileName();
    track.duration = probe.info().duration;
    m_tracks->setMusic(track);
}

void MainWindow::onAddNarration() {
    QString path = QFileDialog::getOpenFileName(this, "Add Narration", {}, AudioFilter);
    if (path.isEmpty()) return;

    MediaProbe probe;
    if (!probe.probe(path) || !probe.info().hasAudio) {
        QMessageBox::warning(this, "Narration", QString("Cannot use %1 as narration.\n%2")
            .arg(QFileInfo(path).fileName(), probe.errorString()));
        return;
    }

    NarrationClip clip;
    clip.sourcePath = path;
    clip.displayName = QFileInfo(path).fileName();
    clip.duration = probe.info().duration;
    clip.startTime = m_engine->currentTime();
    m_tracks->addNarration(clip);
}

void MainWindow::onImportCaptions() {
    QString path = QFileDialog::getOpenFileName(this, "Import Captions", {},
        "Caption Files (*.json);;All Files (*)");
    if (path.isEmpty()) return;

    if (!m_captions->load(path)) {
        QMessageBox::warning(this, "Captions", m_captions->errorString());
        return;
    }
    statusBar()->showMessage(QString("Loaded %1 caption(s)").arg(m_captions->captionCount()), 3000);
}

void MainWindow::onExportRequested() {
    if (m_timeline->totalDuration() <= 0.0) {
        QMessageBox::information(this, "Export", "Add at least one clip before exporting.");
        return;
    }
    if (!m_exportPipeline->startExport()) {
        QMessageBox::warning(this, "Export", m_exportPipeline->isBusy()
            ? QString("An export is already running.")
            : m_exportPipeline->errorString());
    }
}

void MainWindow::onStopExport() {
    m_exportPipeline->stopExport();
    if (!m_exportPipeline->isBusy()) setExporting(false);
}

void MainWindow::onExportDone(const ExportArtifact& artifact) {
    setExporting(false);
    statusBar()->showMessage(QString("Exported %1").arg(artifact.fileName), 8000);
    QMessageBox::information(this, "Export finished",
        QString("Saved %1\n%2 (%3 KB)")
            .arg(artifact.filePath, artifact.profile.description())
            .arg(artifact.sizeBytes / 1024));
    m_exportPipeline->reset();
    m_engine->seek(0.0);
}

void MainWindow::onExportFailed(const QString& reason) {
    setExporting(false);
    statusBar()->showMessage("Export failed", 8000);
    QMessageBox::warning(this, "Export failed", reason);
    m_engine->seek(0.0);
}

void MainWindow::setExporting(bool exporting) {
    m_previewWidget->setControlsEnabled(!exporting);
    m_clipDock->setEnabled(!exporting);
    m_inspectorDock->setEnabled(!exporting);
    m_audioDock->setEnabled(!exporting);
    m_exportAction->setEnabled(!exporting);
    m_stopExportAction->setEnabled(exporting);
    m_exportProgress->setValue(0);
    m_exportProgress->setVisible(exporting);
    if (exporting) m_previewWidget->clearSelection();
}

void MainWindow::onShowLog() {
    QDialog dialog(this);
    dialog.setWindowTitle("Log");
    dialog.resize(800, 480);
    auto* layout = new QVBoxLayout(&dialog);
    auto* view = new QPlainTextEdit(&dialog);
    view->setReadOnly(true);
    view->setLineWrapMode(QPlainTextEdit::NoWrap);
    view->setPlainText(Logging::recentLines().join('\n'));
    layout->addWidget(view);
    dialog.exec();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (m_exportPipeline->isBusy()) {
        auto answer = QMessageBox::question(this, "Export running",
            "An export is still running. Stop it and save what has been recorded?",
            QMessageBox::Yes | QMessageBox::No | QMessageBox::Cancel);
        if (answer == QMessageBox::Cancel) {
            event->ignore();
            return;
        }
        if (answer == QMessageBox::Yes) m_exportPipeline->stopExport();
    }
    m_engine->stop();
    if (m_audioOutput->isOpen()) m_audioOutput->stop();
    event->accept();
}
